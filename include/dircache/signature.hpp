#pragma once

#include "dircache/location.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace dircache {

using Clock = std::chrono::system_clock;

/// Longest lifetime a presigned SigV4 URL may carry (7 days).
constexpr std::chrono::seconds kMaxSignedLifetime{7 * 24 * 60 * 60};

/// A request description an anonymous HTTP client can replay as-is.
/// The expiry lives inside the signature; an expired request is regenerated,
/// never renewed.
struct SignedRequest {
    std::string uri;
    std::vector<std::pair<std::string, std::string>> headers;  // Header mode only
};

/// Raised when a request cannot be signed (missing credentials or bucket,
/// expiry not after the signing time, presigned lifetime too long).
class SigningError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Request signing strategy.
class Signer {
public:
    virtual ~Signer() = default;

    /// "2" or "4"
    virtual std::string version() const = 0;

    /// Sign a single request for `location`, valid until `expires_at`.
    /// `now` is the signing clock; callers pass the same instant for every
    /// request of one job. Throws SigningError on malformed input.
    virtual SignedRequest sign(const KeyPair& key_pair,
                               const std::string& verb,
                               const Location& location,
                               Clock::time_point expires_at,
                               Clock::time_point now) const = 0;
};

/// Legacy query-string signing: HMAC-SHA1 over verb, expiry and resource.
class Aws2Signer final : public Signer {
public:
    std::string version() const override { return "2"; }

    SignedRequest sign(const KeyPair& key_pair,
                       const std::string& verb,
                       const Location& location,
                       Clock::time_point expires_at,
                       Clock::time_point now) const override;

    std::string string_to_sign(const std::string& verb,
                               const Location& location,
                               Clock::time_point expires_at) const;
};

/// SigV4: canonical request, credential scope and HMAC-SHA256 key chain.
class Aws4Signer final : public Signer {
public:
    enum class Mode {
        Query,   // Presigned URL carrying X-Amz-* parameters
        Header   // Plain URL plus Authorization/x-amz-* headers
    };

    explicit Aws4Signer(Mode mode = Mode::Query, std::string service = "s3");

    std::string version() const override { return "4"; }
    Mode mode() const { return mode_; }

    SignedRequest sign(const KeyPair& key_pair,
                       const std::string& verb,
                       const Location& location,
                       Clock::time_point expires_at,
                       Clock::time_point now) const override;

private:
    Mode mode_;
    std::string service_;

    std::string credential_scope(const std::string& date, const std::string& region) const;
    std::string get_canonical_request(const std::string& verb,
                                      const std::string& path,
                                      const std::string& canonical_query,
                                      const std::string& canonical_headers,
                                      const std::string& signed_headers) const;
    std::string get_string_to_sign(const std::string& datetime,
                                   const std::string& scope,
                                   const std::string& canonical_request) const;
    std::string calculate_signature(const std::string& secret,
                                    const std::string& date,
                                    const std::string& region,
                                    const std::string& string_to_sign) const;
};

/// Select the strategy for a signature version. "2" selects the legacy
/// signer; any other value, including empty, selects SigV4.
/// `request_headers` switches SigV4 to header mode (ignored for "2").
std::unique_ptr<Signer> make_signer(const std::string& version, bool request_headers = false);

// Encoding helpers

/// Percent-encode everything outside the RFC 3986 unreserved set.
std::string url_encode(const std::string& str);

/// url_encode() applied per path segment, keeping '/' separators.
std::string url_encode_path(const std::string& path);

std::string base64_encode(const std::vector<uint8_t>& data);
std::string sha256_hex(const std::string& data);

/// "20130524T000000Z"
std::string format_amz_datetime(Clock::time_point tp);
/// "20130524"
std::string format_amz_date(Clock::time_point tp);

}  // namespace dircache
