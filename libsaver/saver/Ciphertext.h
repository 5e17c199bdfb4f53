#ifndef SAVER_CIPHERTEXT_H_
#define SAVER_CIPHERTEXT_H_

#include "libsaver/curve/G1Element.h"
#include <sstream>
#include <string>
#include <vector>

namespace saver {

// c_0 = r X_0, c_i = r X_i + m_i G_in_i
class Ciphertext{
    G1Element c0;
    std::vector<G1Element> c;

    public:
    Ciphertext() {}
    Ciphertext(const G1Element& c0_, const std::vector<G1Element>& c_) : c0(c0_), c(c_) {}

    const G1Element& get_c0() const { return c0; }
    const std::vector<G1Element>& get_c() const { return c; }
    size_t digits() const { return c.size(); }

    static size_t length(size_t n) { return (n + 1) * G1Element::length(); }

    std::string to_bytes() const{
        std::string res = c0.to_bytes();
        for (size_t i = 0; i < c.size(); i++){
            res += c[i].to_bytes();
        }
        return res;
    }

    // false unless bytes hold exactly n + 1 valid points
    bool from_bytes(const std::string& bytes, size_t n){
        size_t len = G1Element::length();
        if (bytes.size() != length(n)){
            return false;
        }
        if (!c0.from_bytes(bytes.substr(0, len))){
            return false;
        }
        c.resize(n);
        for (size_t i = 0; i < n; i++){
            if (!c[i].from_bytes(bytes.substr((i + 1) * len, len))){
                return false;
            }
        }
        return true;
    }

    void pack(std::stringstream& os) const{
        c0.pack(os);
        for (size_t i = 0; i < c.size(); i++){
            c[i].pack(os);
        }
    }

    void unpack(std::stringstream& os, size_t n){
        c0.unpack(os);
        c.resize(n);
        for (size_t i = 0; i < n; i++){
            c[i].unpack(os);
        }
    }

    bool operator==(const Ciphertext& other) const { return c0 == other.c0 && c == other.c; }
    bool operator!=(const Ciphertext& other) const { return !(*this == other); }
};

}

#endif
