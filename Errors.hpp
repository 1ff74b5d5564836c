#pragma once

#include <stdexcept>
#include <system_error>
#include <string>

namespace svf {

//Volume could not be opened or created in the requested mode
class OpenError : public std::system_error {
public:
    OpenError(int error, const std::string& what) :
        std::system_error(error, std::system_category(), what)
    {
    }
};

class NotFoundError : public OpenError {
public:
    using OpenError::OpenError;
};

class PermissionError : public OpenError {
public:
    using OpenError::OpenError;
};

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class InvalidSeekError : public Error {
public:
    using Error::Error;
};

class InvalidArgument : public Error {
public:
    using Error::Error;
};

class ClosedError : public Error {
public:
    using Error::Error;
};

//Operation is not permitted by the open mode
class UnsupportedOperation : public Error {
public:
    using Error::Error;
};

//Broken invariant of the volume set, never expected in correct code
class InternalError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

}
