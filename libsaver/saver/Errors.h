#ifndef SAVER_ERRORS_H_
#define SAVER_ERRORS_H_

#include <stdexcept>
#include <string>

namespace saver {

class SaverError : public std::runtime_error{
    public:
    explicit SaverError(const std::string& what) : std::runtime_error(what) {}
};

// decomposition or witness encoding failed; retrying the same input fails again
class EncodingError : public SaverError{
    public:
    explicit EncodingError(const std::string& what) : SaverError(what) {}
};

// message or digit outside the configured radix / digit count
class RangeError : public EncodingError{
    public:
    explicit RangeError(const std::string& what) : EncodingError(what) {}
};

// public parameters are inconsistent; setup must not continue
class GeneratorMismatchError : public SaverError{
    public:
    explicit GeneratorMismatchError(const std::string& what) : SaverError(what) {}
};

// wrong key or corrupted ciphertext
class DecryptionError : public SaverError{
    public:
    explicit DecryptionError(const std::string& what) : SaverError(what) {}
};

}

#endif
