#ifndef _Plaintext
#define _Plaintext
#include <mcl/bls12_381.hpp>
#include <string>

using namespace mcl::bn;

// scalar field element used for challenges and responses
class Plaintext{
    Fr message;
    public:
    Plaintext();
    Plaintext(const Plaintext& other);
    Plaintext(const Fr& other);

    static size_t length();

    void assign_zero();
    const Fr& get_message() const{return message;};

    void setHashof(const void *msg, size_t msgSize);

    void add(Plaintext &z, const Plaintext &x, const Plaintext &y) const;
    void mul(Plaintext &z, const Plaintext &x, const Plaintext &y) const;

    Plaintext operator+(const Plaintext &other) const{
        Plaintext result;
        add(result, *this, other);
        return result;
    }

    Plaintext operator*(const Plaintext &other) const{
        Plaintext result;
        mul(result, *this, other);
        return result;
    }

    Plaintext& operator=(const Plaintext &other){
        message = other.message;
        return *this;
    }

    bool equals(const Plaintext &other) const;

    bool operator==(const Plaintext &other) const{
        return equals(other);
    }

    bool operator!=(const Plaintext &other) const{
        return !equals(other);
    }

    // canonical little-endian encoding, Fr::getByteSize() bytes
    std::string to_bytes() const;
    bool from_bytes(const std::string& bytes);
};

#endif
