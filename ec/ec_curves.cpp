#include "ec_curves.h"
#include <int_util/int_util.h>
#include <util/test.h>

namespace ecbase { namespace ec {

namespace {

const field_elem p25519 = (field_elem(1) << 255) - 19;
const field_elem p448   = (field_elem(1) << 448) - (field_elem(1) << 224) - 1;

} // unnamed namespace

const weierstrass_domain secp256r1 {
    {
    /* p  */ field_elem("115792089210356248762697446949407573530086143415290314195533631308867097853951"),
    /* a  */ field_elem("0xFFFFFFFF00000001000000000000000000000000FFFFFFFFFFFFFFFFFFFFFFFC"),
    /* b  */ field_elem("0x5AC635D8AA3A93E7B3EBBD55769886BC651D06B0CC53B0F63BCE3C3E27D2604B"),
    /* h  */ field_elem(1),
    },
    {
    /* Gx */ field_elem("0x6B17D1F2E12C4247F8BCE6E563A440F277037D812DEB33A0F4A13945D898C296"),
    /* Gy */ field_elem("0x4FE342E2FE1A7F9B8EE7EB4A7C0F9E162BCE33576B315ECECBB6406837BF51F5"),
             1,
    },
    /* n  */ field_elem("0xFFFFFFFF00000000FFFFFFFFFFFFFFFFBCE6FAADA7179E84F3B9CAC2FC632551"),
};

const weierstrass_domain secp384r1 {
    {
    /* p  */ field_elem("39402006196394479212279040100143613805079739270465446667948293404245721771496870329047266088258938001861606973112319"),
    /* a  */ field_elem("0xFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFEFFFFFFFF0000000000000000FFFFFFFC"),
    /* b  */ field_elem("0xB3312FA7E23EE7E4988E056BE3F82D19181D9C6EFE8141120314088F5013875AC656398D8A2ED19D2A85C8EDD3EC2AEF"),
    /* h  */ field_elem(1),
    },
    {
    /* Gx */ field_elem("0xAA87CA22BE8B05378EB1C71EF320AD746E1D3B628BA79B9859F741E082542A385502F25DBF55296C3A545E3872760AB7"),
    /* Gy */ field_elem("0x3617DE4A96262C6F5D9E98BF9292DC29F8F41DBD289A147CE9DA3113B5F0B8C00A60B1CE1D7E819D7A431D7C90EA0E5F"),
             1,
    },
    /* n  */ field_elem("0xFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFC7634D81F4372DDF581A0DB248B0A77AECEC196ACCC52973"),
};

const weierstrass_domain secp256k1 {
    {
    /* p  */ field_elem("0xFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFEFFFFFC2F"),
    /* a  */ 0,
    /* b  */ 7,
    /* h  */ field_elem(1),
    },
    {
    /* Gx */ field_elem("0x79BE667EF9DCBBAC55A06295CE870B07029BFCDB2DCE28D959F2815B16F81798"),
    /* Gy */ field_elem("0x483ADA7726A3C4655DA4FBFC0E1108A8FD17B448A68554199C47D08FFB10D4B8"),
             1,
    },
    /* n  */ field_elem("0xFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFEBAAEDCE6AF48A03BBFD25E8CD0364141"),
};

// RFC 8032 5.1
const edwards_domain ed25519 {
    {
    /* p  */ p25519,
    /* a  */ p25519 - 1,
    /* d  */ div_mod(p25519 - 121665, 121666, p25519),
    /* h  */ 8,
    /* L  */ (field_elem(1) << 252) + field_elem("27742317777372353535851937790883648493"),
    },
    {
    /* Bx */ field_elem("15112221349535400772501151409588531511454012693041857206046113283949847762202"),
    /* By */ field_elem("46316835694926478169428394003475163141307993866256225615783033603165251855960"),
             1,
    },
};

// RFC 8032 5.2 (untwisted, a = 1)
const edwards_domain ed448 {
    {
    /* p  */ p448,
    /* a  */ 1,
    /* d  */ p448 - 39081,
    /* h  */ 4,
    /* L  */ (field_elem(1) << 446) - field_elem("13818066809895115352007386748515426880336692474882178609894547503885"),
    },
    {
    /* Bx */ field_elem("224580040295924300187604334099896036246789641632564134246125461686950415467406032909029192869357953282578032075146446173674602635247710"),
    /* By */ field_elem("298819210078481492676017930443930673437544040154080242095928241372331506189835876003536878655418784733982303233503462500531545062832660"),
             1,
    },
};

const std::vector<std::string>& curve_names() {
    static const std::vector<std::string> names{"secp256r1", "secp384r1", "secp256k1", "ed25519", "ed448"};
    return names;
}

const curve& curve_from_name(const std::string& name) {
    if (name == "secp256r1") return secp256r1.curve;
    if (name == "secp384r1") return secp384r1.curve;
    if (name == "secp256k1") return secp256k1.curve;
    if (name == "ed25519")   return ed25519.curve;
    if (name == "ed448")     return ed448.curve;
    ECBASE_CHECK_FAILURE("Unknown curve name \"" + name + "\"");
}

} } // namespace ecbase::ec
