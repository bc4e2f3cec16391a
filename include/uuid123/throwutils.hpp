#pragma once

#include <uuid123/strutils.hpp>
#include <stdexcept>
#include <system_error>
#include <string>
#include <errno.h>

namespace uuid123 {

// invalid_format - thrown when text doesn't look like a uuid:  wrong
// number of hex digits, non-hex characters, empty input.  It's an
// invalid_argument, so callers that don't care about the distinction
// can catch std::invalid_argument and get both.
struct invalid_format : public std::invalid_argument{
    explicit invalid_format(const std::string& what) : std::invalid_argument(what){}
};

// unsupported - thrown when a field is requested from a uuid whose
// version doesn't have that field, e.g., the timestamp of a random
// (version 4) uuid.
struct unsupported : public std::logic_error{
    explicit unsupported(const std::string& what) : std::logic_error(what){}
};

// se - it requires way too much typing to throw a std::system error
//   using std:: tools only.  The  se functions allow you to say:
//
//     throw uuid123::se("something didn't work");
//     throw se(EIO, str("short read: got", n, "wanted", 16));
inline std::system_error se(int eno, const std::string& msg){
    return std::system_error(eno, std::system_category(), msg);
}

inline std::system_error se(const std::string& msg){
    return se(errno, msg);
}

// strfunargs - cobble together a call signature for a 'what' string.
// For example:
//
//    throw invalid_format(strfunargs("uuid::from_string", text) + ": not 32 hex digits");
//
// produces a what() string like:
//
//    uuid::from_string(xyzzy): not 32 hex digits
template <typename ... Args>
std::string
strfunargs(const std::string& name, Args ... args){
    return name + "(" + str_sep(", ", args...) + ")";
}

} // namespace uuid123
