#pragma once
#include <uuid123/throwutils.hpp>
#include <cstdlib>
#include <sstream>
#include <string>
#include <type_traits>

namespace uuid123 {

// svto<T>(text) - convert the whole of 'text' to a T with the stream
// extraction operator.  Leading and trailing whitespace is ignored.
// Integers are read as if by "%i", so "0x10", "020" and "16" are all
// sixteen.  Throws std::invalid_argument if the extraction fails,
// if anything but whitespace follows the converted characters, or if
// T is unsigned and the text is negative.
template <typename T>
T svto(const std::string& text){
    std::istringstream iss(text);
    iss.unsetf(std::ios::basefield);
    // operator>> would quietly wrap "-1" into an unsigned T.
    if(std::is_unsigned<T>::value && (iss >> std::ws).peek() == '-')
        throw std::invalid_argument(strfunargs("svto", text) + ": negative value for an unsigned type");
    T ret;
    iss >> ret;
    if(!iss)
        throw std::invalid_argument(strfunargs("svto", text) + ": conversion failed");
    iss >> std::ws;
    if(!iss.eof())
        throw std::invalid_argument(strfunargs("svto", text) + ": trailing characters");
    return ret;
}

// The whole string.  DO NOT stop at the first whitespace.
template <>
inline std::string svto<std::string>(const std::string& text){
    return text;
}

// envto - Convert the named environment variable into a T.
// With two arguments, return the second arg (default)
// if the environment variable doesn't exist.
template <typename T>
T envto(const char *name, const T& dflt){
    const char *e=::getenv(name);
    if(e)
        return svto<T>(e);
    else
        return dflt;
}

template <typename T>
T envto(const char *name){
    const char *e=::getenv(name);
    if(e)
        return svto<T>(e);
    else
        throw se(EINVAL, strfunargs("envto", name));
}

} // namespace uuid123
