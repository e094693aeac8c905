#include "dircache/signature.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/sha.h>

#include <cctype>
#include <ctime>
#include <iomanip>
#include <map>
#include <sstream>

namespace dircache {

// ============================================================================
// Encoding helpers
// ============================================================================

std::string url_encode(const std::string& str) {
    std::ostringstream encoded;
    encoded << std::hex << std::uppercase;

    for (unsigned char c : str) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded << c;
        } else {
            encoded << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }

    return encoded.str();
}

std::string url_encode_path(const std::string& path) {
    std::string result;
    result.reserve(path.size());
    size_t pos = 0;
    while (pos <= path.size()) {
        size_t slash = path.find('/', pos);
        if (slash == std::string::npos) slash = path.size();
        result += url_encode(path.substr(pos, slash - pos));
        if (slash < path.size()) result += '/';
        pos = slash + 1;
    }
    return result;
}

static const char base64_chars[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

std::string base64_encode(const std::vector<uint8_t>& data) {
    std::string result;
    result.reserve((data.size() + 2) / 3 * 4);

    for (size_t i = 0; i < data.size(); i += 3) {
        size_t remaining = data.size() - i;
        uint32_t triple = static_cast<uint32_t>(data[i]) << 16;
        if (remaining > 1) triple |= static_cast<uint32_t>(data[i + 1]) << 8;
        if (remaining > 2) triple |= static_cast<uint32_t>(data[i + 2]);

        result += base64_chars[(triple >> 18) & 0x3F];
        result += base64_chars[(triple >> 12) & 0x3F];
        result += remaining > 1 ? base64_chars[(triple >> 6) & 0x3F] : '=';
        result += remaining > 2 ? base64_chars[triple & 0x3F] : '=';
    }

    return result;
}

static std::string to_hex(const unsigned char* data, size_t len) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

std::string sha256_hex(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.c_str()), data.size(), hash);
    return to_hex(hash, SHA256_DIGEST_LENGTH);
}

static std::vector<uint8_t> hmac(const EVP_MD* md,
                                 const std::vector<uint8_t>& key,
                                 const std::string& data) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;

    if (!HMAC(md, key.data(), static_cast<int>(key.size()),
              reinterpret_cast<const unsigned char*>(data.c_str()), data.size(),
              hash, &hash_len)) {
        throw SigningError("HMAC computation failed");
    }

    return std::vector<uint8_t>(hash, hash + hash_len);
}

static std::vector<uint8_t> hmac_sha256(const std::vector<uint8_t>& key, const std::string& data) {
    return hmac(EVP_sha256(), key, data);
}

static std::vector<uint8_t> hmac_sha256(const std::string& key, const std::string& data) {
    return hmac_sha256(std::vector<uint8_t>(key.begin(), key.end()), data);
}

static std::string format_utc(Clock::time_point tp, const char* fmt) {
    auto time = Clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&time, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, fmt);
    return oss.str();
}

std::string format_amz_datetime(Clock::time_point tp) {
    return format_utc(tp, "%Y%m%dT%H%M%SZ");
}

std::string format_amz_date(Clock::time_point tp) {
    return format_utc(tp, "%Y%m%d");
}

// Shared precondition checks: a malformed credential can never yield a
// usable URL, so refuse to sign at all.
static void check_sign_inputs(const KeyPair& key_pair,
                              const std::string& verb,
                              const Location& location,
                              Clock::time_point expires_at,
                              Clock::time_point now) {
    if (key_pair.id.empty()) throw SigningError("cannot sign request: access key id is empty");
    if (key_pair.secret.empty()) throw SigningError("cannot sign request: secret access key is empty");
    if (location.bucket.empty()) throw SigningError("cannot sign request: bucket is empty");
    if (verb.empty()) throw SigningError("cannot sign request: HTTP verb is empty");
    if (location.path.empty() || location.path.front() != '/')
        throw SigningError("cannot sign request: path must be absolute: " + location.path);
    if (expires_at <= now) throw SigningError("cannot sign request: expiry is not after signing time");
}

static std::string base_uri(const Location& location) {
    return std::string(scheme_to_string(location.scheme)) + "://" + location.hostname() +
           url_encode_path(location.path);
}

// Join already-encoded parameters in key order.
static std::string build_query(const std::map<std::string, std::string>& params) {
    std::ostringstream oss;
    bool first = true;
    for (const auto& [key, value] : params) {
        if (!first) oss << "&";
        oss << key << "=" << value;
        first = false;
    }
    return oss.str();
}

// ============================================================================
// Aws2Signer
// ============================================================================

std::string Aws2Signer::string_to_sign(const std::string& verb,
                                       const Location& location,
                                       Clock::time_point expires_at) const {
    auto expires = std::chrono::duration_cast<std::chrono::seconds>(
                       expires_at.time_since_epoch()).count();

    std::ostringstream oss;
    oss << verb << "\n";
    oss << "\n";  // Content-MD5
    oss << "\n";  // Content-Type
    oss << expires << "\n";
    oss << "/" << location.bucket << location.path;
    return oss.str();
}

SignedRequest Aws2Signer::sign(const KeyPair& key_pair,
                               const std::string& verb,
                               const Location& location,
                               Clock::time_point expires_at,
                               Clock::time_point now) const {
    check_sign_inputs(key_pair, verb, location, expires_at, now);

    auto digest = hmac(EVP_sha1(),
                       std::vector<uint8_t>(key_pair.secret.begin(), key_pair.secret.end()),
                       string_to_sign(verb, location, expires_at));
    auto expires = std::chrono::duration_cast<std::chrono::seconds>(
                       expires_at.time_since_epoch()).count();

    std::map<std::string, std::string> params;
    params["AWSAccessKeyId"] = url_encode(key_pair.id);
    params["Expires"] = std::to_string(expires);
    params["Signature"] = url_encode(base64_encode(digest));

    SignedRequest request;
    request.uri = base_uri(location) + "?" + build_query(params);
    return request;
}

// ============================================================================
// Aws4Signer
// ============================================================================

static const char kAlgorithm[] = "AWS4-HMAC-SHA256";
static const char kUnsignedPayload[] = "UNSIGNED-PAYLOAD";

Aws4Signer::Aws4Signer(Mode mode, std::string service)
    : mode_(mode)
    , service_(std::move(service)) {}

std::string Aws4Signer::credential_scope(const std::string& date, const std::string& region) const {
    return date + "/" + region + "/" + service_ + "/aws4_request";
}

std::string Aws4Signer::get_canonical_request(const std::string& verb,
                                              const std::string& path,
                                              const std::string& canonical_query,
                                              const std::string& canonical_headers,
                                              const std::string& signed_headers) const {
    std::ostringstream oss;
    oss << verb << "\n";
    oss << path << "\n";
    oss << canonical_query << "\n";
    oss << canonical_headers << "\n";
    oss << signed_headers << "\n";
    oss << kUnsignedPayload;
    return oss.str();
}

std::string Aws4Signer::get_string_to_sign(const std::string& datetime,
                                           const std::string& scope,
                                           const std::string& canonical_request) const {
    std::ostringstream oss;
    oss << kAlgorithm << "\n";
    oss << datetime << "\n";
    oss << scope << "\n";
    oss << sha256_hex(canonical_request);
    return oss.str();
}

std::string Aws4Signer::calculate_signature(const std::string& secret,
                                            const std::string& date,
                                            const std::string& region,
                                            const std::string& string_to_sign) const {
    auto k_date = hmac_sha256("AWS4" + secret, date);
    auto k_region = hmac_sha256(k_date, region);
    auto k_service = hmac_sha256(k_region, service_);
    auto k_signing = hmac_sha256(k_service, "aws4_request");

    auto signature = hmac_sha256(k_signing, string_to_sign);
    return to_hex(signature.data(), signature.size());
}

SignedRequest Aws4Signer::sign(const KeyPair& key_pair,
                               const std::string& verb,
                               const Location& location,
                               Clock::time_point expires_at,
                               Clock::time_point now) const {
    check_sign_inputs(key_pair, verb, location, expires_at, now);

    const std::string datetime = format_amz_datetime(now);
    const std::string date = format_amz_date(now);
    const std::string region = location.region.empty() ? "us-east-1" : location.region;
    const std::string scope = credential_scope(date, region);
    const std::string host = location.hostname();
    const std::string path = url_encode_path(location.path);

    SignedRequest request;

    if (mode_ == Mode::Query) {
        auto lifetime = std::chrono::duration_cast<std::chrono::seconds>(expires_at - now);
        if (lifetime > kMaxSignedLifetime)
            throw SigningError("cannot sign request: presigned lifetime " + std::to_string(lifetime.count()) +
                               "s exceeds " + std::to_string(kMaxSignedLifetime.count()) + "s");
        auto expires = lifetime.count();

        std::map<std::string, std::string> params;
        params["X-Amz-Algorithm"] = kAlgorithm;
        params["X-Amz-Credential"] = url_encode(key_pair.id + "/" + scope);
        params["X-Amz-Date"] = datetime;
        params["X-Amz-Expires"] = std::to_string(expires);
        params["X-Amz-SignedHeaders"] = "host";

        std::string query = build_query(params);
        std::string canonical_request =
            get_canonical_request(verb, path, query, "host:" + host + "\n", "host");
        std::string signature = calculate_signature(
            key_pair.secret, date, region, get_string_to_sign(datetime, scope, canonical_request));

        request.uri = base_uri(location) + "?" + query + "&X-Amz-Signature=" + signature;
        return request;
    }

    // Header mode: canonical headers must be sorted by lowercase name
    std::map<std::string, std::string> headers;
    headers["host"] = host;
    headers["x-amz-content-sha256"] = kUnsignedPayload;
    headers["x-amz-date"] = datetime;

    std::string canonical_headers;
    std::string signed_headers;
    for (const auto& [name, value] : headers) {
        canonical_headers += name + ":" + value + "\n";
        if (!signed_headers.empty()) signed_headers += ";";
        signed_headers += name;
    }

    std::string canonical_request =
        get_canonical_request(verb, path, "", canonical_headers, signed_headers);
    std::string signature = calculate_signature(
        key_pair.secret, date, region, get_string_to_sign(datetime, scope, canonical_request));

    std::ostringstream auth;
    auth << kAlgorithm << " ";
    auth << "Credential=" << key_pair.id << "/" << scope << ", ";
    auth << "SignedHeaders=" << signed_headers << ", ";
    auth << "Signature=" << signature;

    request.uri = base_uri(location);
    request.headers.emplace_back("Host", host);
    request.headers.emplace_back("x-amz-content-sha256", kUnsignedPayload);
    request.headers.emplace_back("x-amz-date", datetime);
    request.headers.emplace_back("Authorization", auth.str());
    return request;
}

// ============================================================================
// Factory
// ============================================================================

std::unique_ptr<Signer> make_signer(const std::string& version, bool request_headers) {
    if (version == "2") {
        return std::make_unique<Aws2Signer>();
    }
    return std::make_unique<Aws4Signer>(request_headers ? Aws4Signer::Mode::Header
                                                        : Aws4Signer::Mode::Query);
}

}  // namespace dircache
