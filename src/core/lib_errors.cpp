/*********************************************************************************************************************

The source code of the PSVI library is made publicly available under the terms described in the LICENSE.TXT file
that is distributed with this package.  Please refer to it for further information on licensing.

This file contains the error message table.

*********************************************************************************************************************/

#include <psvi/main.h>

namespace psvi {

static const CSTRING glMessages[int(ERR::END)+1] = {
   "Operation successful.",
   "The result is false.",
   "No action was taken.",
   "The operation failed.",
   "Required arguments were null or not specified.",
   "Invalid arguments passed to function.",
   "There is no data available.",
   "The item was not found.",
   "The item already exists.",
   "There is a mismatch between values.",
   "Out of range.",
   "The data is invalid.",
   "Invalid value.",
   "The request is not supported.",
   "The requested operation is not permitted on a read-only object.",
   "An error occurred while reading data.",
   "An error occurred while writing data.",
   "The object cannot be serialised.",
   "End of error codes."
};

static const int glTotalMessages = int(ERR::END);

/*********************************************************************************************************************

-FUNCTION-
GetErrorMsg: Translates error codes into human readable strings.

The GetErrorMsg() function converts error codes into human readable strings.  If the `Error` is invalid, a string of
"Unknown error code." is returned.

-INPUT-
error Error: The error code to lookup.

-RESULT-
cstr: A human readable string for the error code is returned.

*********************************************************************************************************************/

CSTRING GetErrorMsg(ERR Code)
{
   if ((int(Code) < glTotalMessages) and (int(Code) > 0)) {
      return glMessages[int(Code)];
   }
   else if (Code IS ERR::Okay) return glMessages[0];
   else return "Unknown error code.";
}

} // namespace psvi
