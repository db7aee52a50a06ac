/* Flow-Xfer: Remote file-transfer session pooling
 * Copyright 2023 Akamai Technologies, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in
 * compliance with the License.  You may obtain a copy
 * of the License at
 *
 *   https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in
 * writing, software distributed under the License is
 * distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR
 * CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing
 * permissions and limitations under the License. */

/// @file
#include "xfer/session/error.hpp"
#include <flow/util/util.hpp>
#include <cassert>
#include <istream>
#include <ostream>

namespace xfer::session::error
{

// Types.

/**
 * The boost.system category for errors returned by the xfer::session module.  Think of it as the polymorphic
 * counterpart of session::error::Code, and it kicks in when, for example, one prints an `Error_code`
 * generated by an xfer::session API to an `ostream`.
 */
class Category :
  public boost::system::error_category
{
public:
  // Constants.

  /// The one Category.
  static const Category S_CATEGORY;

  // Methods.

  /**
   * Implements super-class API: returns a `static` string representing this `error_category` (which,
   * for example, shows up in the `ostream` representation of any Category-belonging `Error_code`).
   *
   * @return A `static` string that's a brief description of this error category.
   */
  const char* name() const noexcept override;

  /**
   * Implements super-class API: given the integer value of an xfer::session error code in this category,
   * returns a string representing that error.
   *
   * @param val
   *        Error code value.
   * @return See above.
   */
  std::string message(int val) const override;

  /**
   * Returns a brief string, suitable for `ostream` output and `istream` input, representing `code`.
   *
   * @param code
   *        The code.
   * @return See above.
   */
  static String_view code_symbol(Code code);

private:
  // Constructors.

  /// Boring constructor.
  explicit Category();
}; // class Category

// Static initializations.

const Category Category::S_CATEGORY;

// Implementations.

Error_code make_error_code(Code err_code)
{
  /* Assign Category as the category for session::error::Code-cast error_codes;
   * this basically glues together Category::name()/message() with the Code enum. */
  return Error_code(static_cast<int>(err_code), Category::S_CATEGORY);
}

Category::Category() = default;

const char* Category::name() const noexcept // Virtual.
{
  return "xfer/session";
}

std::string Category::message(int val) const // Virtual.
{
  // KEEP THESE STRINGS IN SYNC WITH COMMENT IN error.hpp ON THE INDIVIDUAL ENUM MEMBERS!

  /* Just in case the compiler warns about not all enum values being handled in the switch(), we've
   * got them all; and the sentinel is not a real error. */
  switch (static_cast<Code>(val))
  {
  case Code::S_INVALID_ARGUMENT:
    return "User called an API with 1 or more arguments against its documented requirements.";
  case Code::S_POOL_NOT_STARTED:
    return "Session pool: session is unavailable, since the pool was never started; start() it first.  "
           "Sessions are never created (nor waited-for) on behalf of a not-yet-started pool.";

  case Code::S_END_SENTINEL:
    assert(false && "SENTINEL: Not an error.  "
                    "This Code must never be issued by an error/success-emitting API; I/O use only.");
  }
  assert(false);
  return "";
} // Category::message()

String_view Category::code_symbol(Code code) // Static.
{
  // Note: Must satisfy istream_to_enum() requirements.

  switch (code)
  {
  case Code::S_INVALID_ARGUMENT:
    return "INVALID_ARGUMENT";
  case Code::S_POOL_NOT_STARTED:
    return "POOL_NOT_STARTED";

  case Code::S_END_SENTINEL:
    return "END_SENTINEL";
  }
  assert(false);
  return "";
}

std::ostream& operator<<(std::ostream& os, Code val)
{
  // Note: Must satisfy istream_to_enum() requirements.
  return os << Category::code_symbol(val);
}

std::istream& operator>>(std::istream& is, Code& val)
{
  /* Range [<1st Code>, END_SENTINEL); no match => END_SENTINEL;
   * allow for number instead of ostream<< string; case-insensitive. */
  val = flow::util::istream_to_enum(&is, Code::S_END_SENTINEL, Code::S_END_SENTINEL, true, false,
                                    Code(S_CODE_LOWEST_INT_VALUE));
  return is;
}

} // namespace xfer::session::error
