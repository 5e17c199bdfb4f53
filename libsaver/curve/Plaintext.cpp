#include "libsaver/curve/Plaintext.h"
#include <stdexcept>

Plaintext::Plaintext(){
    message.clear();
}

Plaintext::Plaintext(const Plaintext& other){
    message = other.message;
}

Plaintext::Plaintext(const Fr& other){
    message = other;
}

size_t Plaintext::length(){
    return Fr::getByteSize();
}

void Plaintext::assign_zero(){
    message.clear();
}

void Plaintext::setHashof(const void *msg, size_t msgSize){
    message.setHashOf(msg, msgSize);
}

void Plaintext::add(Plaintext &z, const Plaintext &x, const Plaintext &y) const{
    Fr::add(z.message, x.message, y.message);
}

void Plaintext::mul(Plaintext &z, const Plaintext &x, const Plaintext &y) const{
    Fr::mul(z.message, x.message, y.message);
}

bool Plaintext::equals(const Plaintext &other) const{
    return message == other.message;
}

std::string Plaintext::to_bytes() const{
    std::string buf(length(), '\0');
    size_t n = message.serialize(&buf[0], buf.size());
    if (n != buf.size()){
        throw std::runtime_error("Fr serialization failed");
    }
    return buf;
}

bool Plaintext::from_bytes(const std::string& bytes){
    if (bytes.size() != length()){
        return false;
    }
    Fr tmp;
    size_t n = tmp.deserialize(bytes.data(), bytes.size());
    if (n != bytes.size()){
        return false;
    }
    message = tmp;
    return true;
}
