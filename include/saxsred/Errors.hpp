#pragma once
#include <stdexcept>
#include <string>

namespace saxsred {

/* --------------------------------------------------------------------- */
/*  Fatal conditions of the reduction pipeline.  Each one aborts the      */
/*  current batch item; the orchestration layer can tell them apart by    */
/*  type and report which sample/file failed.                             */
/* --------------------------------------------------------------------- */
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// two curves that are combined do not share the same q grid
class GridMismatchError : public Error {
public:
    using Error::Error;
};

// a 2D frame has a different pixel shape than its dark reference
class ShapeMismatchError : public Error {
public:
    using Error::Error;
};

class InvalidConfigurationError : public Error {
public:
    using Error::Error;
};

// transmission value missing / non-positive where one is required
class InvalidTransmissionError : public Error {
public:
    using Error::Error;
};

} // namespace saxsred
