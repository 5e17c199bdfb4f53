#include "libsaver/curve/G2Element.h"
#include <stdexcept>
using namespace mcl::bn;

namespace {
G2 g2_generator;
}

void G2Element::init_generator()
{
    // any point of the prime order subgroup works as the G2 base
    hashAndMapToG2(g2_generator, "libsaver G2 generator");
}

G2Element G2Element::generator()
{
    return G2Element(g2_generator);
}

G2Element::G2Element(){
    point.clear();
}

G2Element::G2Element(const G2Element& other) :
        point(other.point)
{
}

G2Element::G2Element(const G2& p) :
        point(p)
{
}

G2Element::G2Element(const Fr& scalar)
{
    G2::mul(point, g2_generator, scalar);
}

G2Element& G2Element::operator=(const G2Element& other)
{
    point = other.point;
    return *this;
}

G2Element G2Element::operator+(const G2Element& other) const
{
    G2Element res;
    G2::add(res.point, point, other.point);
    return res;
}

G2Element G2Element::operator*(const Fr& other) const
{
    G2Element res;
    G2::mul(res.point, point, other);
    return res;
}

G2Element& G2Element::operator+=(const G2Element& other)
{
    G2::add(point, point, other.point);
    return *this;
}

bool G2Element::operator==(const G2Element& other) const
{
    return point == other.point;
}

bool G2Element::operator!=(const G2Element& other) const
{
    return point != other.point;
}

G2Element G2Element::mulVec(const std::vector<G2Element>& bases, const std::vector<Fr>& scalars)
{
    if (bases.size() != scalars.size()){
        throw std::invalid_argument("G2Element::mulVec: size mismatch");
    }
    G2Element res;
    if (bases.empty()){
        return res;
    }
    std::vector<G2> points(bases.size());
    for (size_t i = 0; i < bases.size(); i++){
        points[i] = bases[i].point;
    }
    G2::mulVec(res.point, points.data(), scalars.data(), points.size());
    return res;
}

void G2Element::pack(std::stringstream& os) const
{
    os << to_bytes();
}

void G2Element::unpack(std::stringstream& os)
{
    std::string buf(length(), '\0');
    os.read(&buf[0], buf.size());
    if (static_cast<size_t>(os.gcount()) != buf.size() || !from_bytes(buf)){
        throw std::runtime_error("G2 unpack failed");
    }
}

std::string G2Element::to_bytes() const
{
    std::string buf(length(), '\0');
    size_t n = point.serialize(&buf[0], buf.size());
    if (n != buf.size()){
        throw std::runtime_error("G2 serialization failed");
    }
    return buf;
}

bool G2Element::from_bytes(const std::string& bytes)
{
    if (bytes.size() != length()){
        return false;
    }
    G2 tmp;
    size_t n = tmp.deserialize(bytes.data(), bytes.size());
    if (n != bytes.size()){
        return false;
    }
    point = tmp;
    return true;
}

GT pair_of(const G1Element& p, const G2Element& q)
{
    GT e;
    pairing(e, p.getPoint(), q.getPoint());
    return e;
}
