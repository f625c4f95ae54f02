#include "crypto/secp256k1.h"
#include "core/hex.h"

#include <cstring>
#include <memory>

#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/crypto.h>
#include <openssl/ec.h>
#include <openssl/evp.h>
#include <openssl/param_build.h>

namespace crypto {

// ---------------------------------------------------------------------------
// secp256k1 curve order (big-endian).
// n = FFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFEBAAEDCE6AF48A03BBFD25E8CD0364141
// ---------------------------------------------------------------------------
static const uint8_t SECP256K1_ORDER[] = {
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFE,
    0xBA, 0xAE, 0xDC, 0xE6, 0xAF, 0x48, 0xA0, 0x3B,
    0xBF, 0xD2, 0x5E, 0x8C, 0xD0, 0x36, 0x41, 0x41
};

// half-order = n / 2  (for low-S normalisation)
static const uint8_t SECP256K1_HALF_ORDER[] = {
    0x7F, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
    0x5D, 0x57, 0x6E, 0x73, 0x57, 0xA4, 0x50, 0x1D,
    0xDF, 0xE9, 0x2F, 0x46, 0x68, 0x1B, 0x20, 0xA0
};

// Signing retries when OpenSSL's random nonce lands on a recovery id the
// chain cannot express (x(R) >= n), which happens with negligible odds.
static constexpr int MAX_SIGN_ATTEMPTS = 4;

// ---------------------------------------------------------------------------
// RAII helpers for OpenSSL objects
// ---------------------------------------------------------------------------
struct BN_Deleter  { void operator()(BIGNUM* p)       const { BN_free(p); } };
struct BN_CTX_Del  { void operator()(BN_CTX* p)       const { BN_CTX_free(p); } };
struct EC_GRP_Del  { void operator()(EC_GROUP* p)     const { EC_GROUP_free(p); } };
struct EC_PT_Del   { void operator()(EC_POINT* p)     const { EC_POINT_free(p); } };
struct EVP_KEY_Del { void operator()(EVP_PKEY* p)     const { EVP_PKEY_free(p); } };
struct EVP_CTX_Del { void operator()(EVP_PKEY_CTX* p) const { EVP_PKEY_CTX_free(p); } };
struct PB_Deleter  { void operator()(OSSL_PARAM_BLD* p) const {
    OSSL_PARAM_BLD_free(p);
} };
struct OP_Deleter  { void operator()(OSSL_PARAM* p)   const {
    OSSL_PARAM_free(p);
} };

using BN_ptr      = std::unique_ptr<BIGNUM, BN_Deleter>;
using BN_CTX_ptr  = std::unique_ptr<BN_CTX, BN_CTX_Del>;
using EC_GRP_ptr  = std::unique_ptr<EC_GROUP, EC_GRP_Del>;
using EC_PT_ptr   = std::unique_ptr<EC_POINT, EC_PT_Del>;
using EVP_KEY_ptr = std::unique_ptr<EVP_PKEY, EVP_KEY_Del>;
using EVP_CTX_ptr = std::unique_ptr<EVP_PKEY_CTX, EVP_CTX_Del>;
using PB_ptr      = std::unique_ptr<OSSL_PARAM_BLD, PB_Deleter>;
using OP_ptr      = std::unique_ptr<OSSL_PARAM, OP_Deleter>;

// ---------------------------------------------------------------------------
// Curve constants, built once.
// ---------------------------------------------------------------------------
static EC_GROUP* secp256k1_group() {
    static EC_GRP_ptr group{
        EC_GROUP_new_by_curve_name(NID_secp256k1)};
    return group.get();
}

static const BIGNUM* secp256k1_order_bn() {
    static BN_ptr order{BN_bin2bn(SECP256K1_ORDER,
                                  sizeof(SECP256K1_ORDER), nullptr)};
    return order.get();
}

static const BIGNUM* secp256k1_half_order_bn() {
    static BN_ptr half{BN_bin2bn(SECP256K1_HALF_ORDER,
                                 sizeof(SECP256K1_HALF_ORDER), nullptr)};
    return half.get();
}

static core::Error crypto_error(std::string msg) {
    return core::make_error(core::ErrorCode::CRYPTO_ERROR, std::move(msg));
}

static void bn_to_32(const BIGNUM* bn, uint8_t out[32]) {
    std::memset(out, 0, 32);
    int bn_bytes = BN_num_bytes(bn);
    if (bn_bytes > 0 && bn_bytes <= 32) {
        BN_bn2bin(bn, out + (32 - bn_bytes));
    }
}

// ---------------------------------------------------------------------------
// EVP_PKEY construction from raw key material (OSSL_PARAM).
// ---------------------------------------------------------------------------
static EVP_PKEY* pkey_from_params(OSSL_PARAM_BLD* bld, int selection) {
    OP_ptr params{OSSL_PARAM_BLD_to_param(bld)};
    if (!params) return nullptr;

    EVP_CTX_ptr pctx{EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr)};
    if (!pctx) return nullptr;
    if (EVP_PKEY_fromdata_init(pctx.get()) <= 0) return nullptr;

    EVP_PKEY* pkey = nullptr;
    if (EVP_PKEY_fromdata(pctx.get(), &pkey, selection, params.get()) <= 0) {
        return nullptr;
    }
    return pkey;
}

static EVP_PKEY* build_pkey_from_secret(const uint8_t* secret_32) {
    PB_ptr bld{OSSL_PARAM_BLD_new()};
    if (!bld) return nullptr;

    if (!OSSL_PARAM_BLD_push_utf8_string(
            bld.get(), OSSL_PKEY_PARAM_GROUP_NAME, "secp256k1", 0)) {
        return nullptr;
    }

    // OSSL_PARAM_BLD_push_BN keeps a pointer; priv_bn must outlive
    // OSSL_PARAM_BLD_to_param().
    BN_ptr priv_bn{BN_secure_new()};
    if (!priv_bn || !BN_bin2bn(secret_32, 32, priv_bn.get())) return nullptr;
    if (!OSSL_PARAM_BLD_push_BN(
            bld.get(), OSSL_PKEY_PARAM_PRIV_KEY, priv_bn.get())) {
        return nullptr;
    }

    // Public point = secret * G, uncompressed.
    BN_CTX_ptr ctx{BN_CTX_new()};
    EC_GROUP* grp = secp256k1_group();
    EC_PT_ptr pub_pt{EC_POINT_new(grp)};
    if (!ctx || !pub_pt ||
        !EC_POINT_mul(grp, pub_pt.get(), priv_bn.get(), nullptr, nullptr,
                      ctx.get())) {
        return nullptr;
    }

    uint8_t pub_buf[65];
    size_t pub_len = EC_POINT_point2oct(
        grp, pub_pt.get(), POINT_CONVERSION_UNCOMPRESSED,
        pub_buf, sizeof(pub_buf), ctx.get());
    if (pub_len != 65) return nullptr;

    if (!OSSL_PARAM_BLD_push_octet_string(
            bld.get(), OSSL_PKEY_PARAM_PUB_KEY, pub_buf, pub_len)) {
        return nullptr;
    }

    return pkey_from_params(bld.get(), EVP_PKEY_KEYPAIR);
}

static EVP_PKEY* build_pkey_from_pubkey(const uint8_t* pub_data,
                                        size_t pub_len) {
    PB_ptr bld{OSSL_PARAM_BLD_new()};
    if (!bld) return nullptr;

    if (!OSSL_PARAM_BLD_push_utf8_string(
            bld.get(), OSSL_PKEY_PARAM_GROUP_NAME, "secp256k1", 0)) {
        return nullptr;
    }
    if (!OSSL_PARAM_BLD_push_octet_string(
            bld.get(), OSSL_PKEY_PARAM_PUB_KEY, pub_data, pub_len)) {
        return nullptr;
    }
    return pkey_from_params(bld.get(), EVP_PKEY_PUBLIC_KEY);
}

static bool extract_pubkey_uncompressed(EVP_PKEY* pkey, uint8_t out[65]) {
    size_t len = 0;
    if (!EVP_PKEY_get_octet_string_param(
            pkey, OSSL_PKEY_PARAM_PUB_KEY, out, 65, &len)) {
        return false;
    }
    return len == 65;
}

// ---------------------------------------------------------------------------
// DER <-> (r, s)
// ---------------------------------------------------------------------------
static void encode_der_integer(const uint8_t* val, size_t val_len,
                               std::vector<uint8_t>& out) {
    // Skip leading zeros but keep at least one byte.
    size_t skip = 0;
    while (skip < val_len - 1 && val[skip] == 0) ++skip;
    const uint8_t* start = val + skip;
    size_t len = val_len - skip;

    bool need_pad = (start[0] & 0x80) != 0;
    out.push_back(0x02);  // INTEGER
    out.push_back(static_cast<uint8_t>(len + (need_pad ? 1 : 0)));
    if (need_pad) out.push_back(0x00);
    out.insert(out.end(), start, start + len);
}

static std::vector<uint8_t> compact_to_der(const uint8_t* r32,
                                           const uint8_t* s32) {
    std::vector<uint8_t> inner;
    inner.reserve(72);
    encode_der_integer(r32, 32, inner);
    encode_der_integer(s32, 32, inner);

    std::vector<uint8_t> der;
    der.reserve(inner.size() + 2);
    der.push_back(0x30);  // SEQUENCE
    der.push_back(static_cast<uint8_t>(inner.size()));
    der.insert(der.end(), inner.begin(), inner.end());
    return der;
}

static bool der_to_compact(const uint8_t* der, size_t der_len,
                           uint8_t r_out[32], uint8_t s_out[32]) {
    if (der_len < 8 || der[0] != 0x30) return false;
    size_t seq_len = der[1];
    if (seq_len + 2 > der_len) return false;

    const uint8_t* p = der + 2;
    const uint8_t* end = der + 2 + seq_len;

    auto read_int = [&](uint8_t out[32]) -> bool {
        if (p >= end || *p != 0x02) return false;
        ++p;
        if (p >= end) return false;
        size_t ilen = *p++;
        if (p + ilen > end) return false;

        const uint8_t* istart = p;
        size_t ilen_raw = ilen;
        if (ilen > 1 && istart[0] == 0x00) {
            ++istart;
            --ilen_raw;
        }
        if (ilen_raw > 32) return false;

        std::memset(out, 0, 32);
        std::memcpy(out + 32 - ilen_raw, istart, ilen_raw);
        p += ilen;
        return true;
    };

    return read_int(r_out) && read_int(s_out);
}

// ---------------------------------------------------------------------------
// Raw-digest sign / verify through EVP (no message digest applied).
// ---------------------------------------------------------------------------
static std::vector<uint8_t> evp_sign_hash(EVP_PKEY* pkey,
                                          const uint8_t* hash32) {
    EVP_CTX_ptr ctx{EVP_PKEY_CTX_new(pkey, nullptr)};
    if (!ctx || EVP_PKEY_sign_init(ctx.get()) <= 0) return {};

    size_t sig_len = 0;
    if (EVP_PKEY_sign(ctx.get(), nullptr, &sig_len, hash32, 32) <= 0) {
        return {};
    }
    std::vector<uint8_t> sig(sig_len);
    if (EVP_PKEY_sign(ctx.get(), sig.data(), &sig_len, hash32, 32) <= 0) {
        return {};
    }
    sig.resize(sig_len);
    return sig;
}

static bool evp_verify_hash(EVP_PKEY* pkey, const uint8_t* hash32,
                            const uint8_t* der_sig, size_t der_sig_len) {
    EVP_CTX_ptr ctx{EVP_PKEY_CTX_new(pkey, nullptr)};
    if (!ctx || EVP_PKEY_verify_init(ctx.get()) <= 0) return false;
    return EVP_PKEY_verify(ctx.get(), der_sig, der_sig_len, hash32, 32) == 1;
}

// ---------------------------------------------------------------------------
// RecoverableSignature
// ---------------------------------------------------------------------------

std::array<uint8_t, 64> RecoverableSignature::compact() const {
    std::array<uint8_t, 64> out{};
    std::memcpy(out.data(), r.data(), 32);
    std::memcpy(out.data() + 32, s.data(), 32);
    return out;
}

// ---------------------------------------------------------------------------
// ECKey lifetime
// ---------------------------------------------------------------------------

ECKey::~ECKey() {
    if (pkey_) EVP_PKEY_free(pkey_);
    OPENSSL_cleanse(secret_.data(), secret_.size());
}

ECKey::ECKey(ECKey&& other) noexcept
    : secret_(other.secret_),
      pkey_(other.pkey_) {
    other.pkey_ = nullptr;
    OPENSSL_cleanse(other.secret_.data(), other.secret_.size());
}

ECKey& ECKey::operator=(ECKey&& other) noexcept {
    if (this != &other) {
        if (pkey_) EVP_PKEY_free(pkey_);
        OPENSSL_cleanse(secret_.data(), secret_.size());

        secret_ = other.secret_;
        pkey_ = other.pkey_;

        other.pkey_ = nullptr;
        OPENSSL_cleanse(other.secret_.data(), other.secret_.size());
    }
    return *this;
}

// ---------------------------------------------------------------------------
// Key construction
// ---------------------------------------------------------------------------

core::Result<ECKey> ECKey::from_secret(std::span<const uint8_t, 32> secret) {
    // Secret must be in [1, n-1].
    BN_ptr s_bn{BN_bin2bn(secret.data(), 32, nullptr)};
    if (!s_bn || BN_is_zero(s_bn.get()) ||
        BN_cmp(s_bn.get(), secp256k1_order_bn()) >= 0) {
        return core::make_error(core::ErrorCode::CRYPTO_KEY_FAIL,
                                "secret key out of range for secp256k1");
    }

    ECKey key;
    std::memcpy(key.secret_.data(), secret.data(), 32);
    key.pkey_ = build_pkey_from_secret(key.secret_.data());
    if (!key.pkey_) {
        return crypto_error("failed to build EVP_PKEY from secret");
    }
    return key;
}

core::Result<ECKey> ECKey::from_hex(std::string_view hex) {
    auto bytes = core::from_hex(hex);
    if (!bytes || bytes->size() != 32) {
        if (bytes) OPENSSL_cleanse(bytes->data(), bytes->size());
        return core::make_error(core::ErrorCode::CRYPTO_KEY_FAIL,
                                "private key must be 32 bytes of hex");
    }
    auto key = from_secret(std::span<const uint8_t, 32>(bytes->data(), 32));
    OPENSSL_cleanse(bytes->data(), bytes->size());
    return key;
}

std::array<uint8_t, 65> ECKey::pubkey_uncompressed() const {
    std::array<uint8_t, 65> out{};
    if (!pkey_) return out;
    if (!extract_pubkey_uncompressed(pkey_, out.data())) {
        out.fill(0);
    }
    return out;
}

// ---------------------------------------------------------------------------
// Signing
// ---------------------------------------------------------------------------

core::Result<RecoverableSignature> ECKey::sign_recoverable(
    const core::Hash256& hash) const {
    if (!pkey_) {
        return crypto_error("signing with an empty key");
    }
    const auto my_pub = pubkey_uncompressed();

    for (int attempt = 0; attempt < MAX_SIGN_ATTEMPTS; ++attempt) {
        std::vector<uint8_t> der = evp_sign_hash(pkey_, hash.data());
        if (der.empty()) {
            return core::make_error(core::ErrorCode::CRYPTO_SIG_FAIL,
                                    "EVP_PKEY_sign failed");
        }

        RecoverableSignature sig;
        if (!der_to_compact(der.data(), der.size(),
                            sig.r.data(), sig.s.data())) {
            return core::make_error(core::ErrorCode::CRYPTO_SIG_FAIL,
                                    "malformed DER signature from OpenSSL");
        }

        // Low-S: s > n/2 becomes n - s.
        BN_ptr s_bn{BN_bin2bn(sig.s.data(), 32, nullptr)};
        if (!s_bn) return crypto_error("BN_bin2bn failed");
        if (BN_cmp(s_bn.get(), secp256k1_half_order_bn()) > 0) {
            if (!BN_sub(s_bn.get(), secp256k1_order_bn(), s_bn.get())) {
                return crypto_error("BN_sub failed");
            }
            bn_to_32(s_bn.get(), sig.s.data());
        }

        // Find the recovery id by trial recovery against our own key.
        const auto compact = sig.compact();
        for (int id = 0; id < 2; ++id) {
            auto recovered = recover_compact(hash, compact, id);
            if (recovered.ok() && recovered.value() == my_pub) {
                sig.recovery_id = id;
                return sig;
            }
        }
    }
    return core::make_error(core::ErrorCode::CRYPTO_SIG_FAIL,
                            "could not determine recovery id");
}

// ---------------------------------------------------------------------------
// Verification / recovery
// ---------------------------------------------------------------------------

bool ECKey::verify_compact(std::span<const uint8_t> pubkey,
                           const core::Hash256& hash,
                           std::span<const uint8_t, 64> sig) {
    if (pubkey.size() != 33 && pubkey.size() != 65) return false;
    EVP_KEY_ptr pk{build_pkey_from_pubkey(pubkey.data(), pubkey.size())};
    if (!pk) return false;
    std::vector<uint8_t> der = compact_to_der(sig.data(), sig.data() + 32);
    return evp_verify_hash(pk.get(), hash.data(), der.data(), der.size());
}

core::Result<std::array<uint8_t, 65>> ECKey::recover_compact(
    const core::Hash256& hash,
    std::span<const uint8_t, 64> sig,
    int recovery_id) {
    if (recovery_id < 0 || recovery_id > 3) {
        return crypto_error("recovery_id must be 0..3");
    }

    EC_GROUP* grp = secp256k1_group();
    BN_CTX_ptr ctx{BN_CTX_new()};
    const BIGNUM* order = secp256k1_order_bn();
    if (!grp || !ctx) return crypto_error("secp256k1 context unavailable");

    BN_ptr r_bn{BN_bin2bn(sig.data(), 32, nullptr)};
    BN_ptr s_bn{BN_bin2bn(sig.data() + 32, 32, nullptr)};
    if (!r_bn || !s_bn || BN_is_zero(r_bn.get()) || BN_is_zero(s_bn.get()) ||
        BN_cmp(r_bn.get(), order) >= 0 || BN_cmp(s_bn.get(), order) >= 0) {
        return crypto_error("invalid compact signature");
    }

    // x = r + (recovery_id >> 1) * n
    BN_ptr x_bn{BN_dup(r_bn.get())};
    if (!x_bn) return crypto_error("BN_dup failed");
    if ((recovery_id & 2) && !BN_add(x_bn.get(), x_bn.get(), order)) {
        return crypto_error("BN_add failed");
    }

    // R = (x, y) with y from y^2 = x^3 + 7, parity from recovery_id bit 0.
    EC_PT_ptr R{EC_POINT_new(grp)};
    if (!R || !EC_POINT_set_compressed_coordinates(
                  grp, R.get(), x_bn.get(), recovery_id & 1, ctx.get())) {
        return crypto_error("no curve point for r and recovery_id");
    }

    // Q = r^-1 * (s*R - e*G)
    BN_ptr e_bn{BN_bin2bn(hash.data(), 32, nullptr)};
    BN_ptr r_inv{BN_mod_inverse(nullptr, r_bn.get(), order, ctx.get())};
    BN_ptr neg_e{BN_new()};
    if (!e_bn || !r_inv || !neg_e) return crypto_error("bignum allocation");
    if (!BN_mod_sub(neg_e.get(), order, e_bn.get(), order, ctx.get())) {
        return crypto_error("BN_mod_sub failed");
    }

    // u1 = -e * r^-1, u2 = s * r^-1; Q = u1*G + u2*R
    BN_ptr u1{BN_new()};
    BN_ptr u2{BN_new()};
    if (!u1 || !u2 ||
        !BN_mod_mul(u1.get(), neg_e.get(), r_inv.get(), order, ctx.get()) ||
        !BN_mod_mul(u2.get(), s_bn.get(), r_inv.get(), order, ctx.get())) {
        return crypto_error("BN_mod_mul failed");
    }

    EC_PT_ptr Q{EC_POINT_new(grp)};
    if (!Q || !EC_POINT_mul(grp, Q.get(), u1.get(), R.get(), u2.get(),
                            ctx.get())) {
        return crypto_error("EC_POINT_mul failed");
    }
    if (EC_POINT_is_at_infinity(grp, Q.get())) {
        return crypto_error("recovered point is at infinity");
    }

    std::array<uint8_t, 65> result{};
    size_t len = EC_POINT_point2oct(
        grp, Q.get(), POINT_CONVERSION_UNCOMPRESSED,
        result.data(), result.size(), ctx.get());
    if (len != 65) {
        return crypto_error("failed to serialize recovered pubkey");
    }
    return result;
}

}  // namespace crypto
