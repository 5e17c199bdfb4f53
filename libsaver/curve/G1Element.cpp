#include "libsaver/curve/G1Element.h"
#include "libsaver/curve/G2Element.h"
#include <mutex>
#include <stdexcept>
using namespace mcl::bn;

namespace {
std::mutex init_mutex;
bool init_done = false;
CurveType init_curve = CurveType::BLS12_381;
G1 g1_generator;

const char* BLS12_381_G1 = "1 0x17f1d3a73197d7942695638c4fa9ac0fc3688c4f9774b905a14e3a3f171bac586c55e83ff97a1aeffb3af00adb22c6bb 0x08b3f481e3aaa0f1a09e30ed741d8ae4fcf5e095d5d00af600db18cb2c04b3edd03cc744a2888ae40caa232946c5e7e1";
const char* BN254_G1 = "1 1 2";
}

void G1Element::init(CurveType curve)
{
    std::lock_guard<std::mutex> lock(init_mutex);
    if (init_done){
        if (curve != init_curve){
            throw std::runtime_error("pairing already initialised for " + type_string());
        }
        return;
    }
    if (curve == CurveType::BLS12_381){
        initPairing(mcl::BLS12_381);
        g1_generator.setStr(BLS12_381_G1);
    } else {
        initPairing(mcl::BN_SNARK1);
        g1_generator.setStr(BN254_G1);
    }
    // reject points outside the prime order subgroup on deserialization
    verifyOrderG1(true);
    verifyOrderG2(true);
    G2Element::init_generator();
    init_curve = curve;
    init_done = true;
}

CurveType G1Element::curve()
{
    return init_curve;
}

std::string G1Element::type_string()
{
    return init_curve == CurveType::BLS12_381 ? "BLS12_381" : "BN254";
}

G1Element G1Element::generator()
{
    return G1Element(g1_generator);
}

G1Element G1Element::hash_to_point(const std::string& tag)
{
    G1Element res;
    hashAndMapToG1(res.point, tag);
    return res;
}

G1Element::G1Element(){
    point.clear();
}

G1Element::G1Element(const G1& p) :
        point(p)
{
}

G1Element::G1Element(const Fr& scalar)
{
    G1::mul(point, g1_generator, scalar);
}

G1Element::G1Element(const G1Element& other){
    point = other.point;
}

G1Element::~G1Element(){
    point.clear();
}

G1Element& G1Element::operator=(const G1Element& other)
{
    point = other.point;
    return *this;
}

G1Element G1Element::operator+(const G1Element& other) const
{
    G1Element res;
    G1::add(res.point, point, other.point);
    return res;
}

G1Element G1Element::operator*(const Fr& other) const{
    G1Element res;
    G1::mul(res.point, point, other);
    return res;
}

G1Element G1Element::negate() const{
    G1Element res;
    G1::neg(res.point, point);
    return res;
}

G1Element G1Element::dbl() const{
    G1Element res;
    G1::dbl(res.point, point);
    return res;
}

G1Element& G1Element::operator+=(const G1Element& other){
    G1::add(point, point, other.point);
    return *this;
}

G1Element& G1Element::operator-=(const G1Element& other){
    G1::sub(point, point, other.point);
    return *this;
}

bool G1Element::operator==(const G1Element& other) const{
    return point == other.point;
}

bool G1Element::operator!=(const G1Element& other) const{
    return point != other.point;
}

G1Element G1Element::mulVec(const std::vector<G1Element>& bases, const std::vector<Fr>& scalars)
{
    if (bases.size() != scalars.size()){
        throw std::invalid_argument("G1Element::mulVec: size mismatch");
    }
    G1Element res;
    if (bases.empty()){
        return res;
    }
    std::vector<G1> points(bases.size());
    for (size_t i = 0; i < bases.size(); i++){
        points[i] = bases[i].point;
    }
    G1::mulVec(res.point, points.data(), scalars.data(), points.size());
    return res;
}

void G1Element::pack(std::stringstream& os) const{
    os << to_bytes();
}

void G1Element::unpack(std::stringstream& os){
    std::string buf(length(), '\0');
    os.read(&buf[0], buf.size());
    if (static_cast<size_t>(os.gcount()) != buf.size() || !from_bytes(buf)){
        throw std::runtime_error("G1 unpack failed");
    }
}

std::string G1Element::to_bytes() const{
    std::string buf(length(), '\0');
    size_t n = point.serialize(&buf[0], buf.size());
    if (n != buf.size()){
        throw std::runtime_error("G1 serialization failed");
    }
    return buf;
}

bool G1Element::from_bytes(const std::string& bytes){
    if (bytes.size() != length()){
        return false;
    }
    G1 tmp;
    size_t n = tmp.deserialize(bytes.data(), bytes.size());
    if (n != bytes.size()){
        return false;
    }
    point = tmp;
    return true;
}
