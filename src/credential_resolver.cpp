#include "credential_resolver.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace gitmigrate {

namespace {

constexpr const char* kSecureScheme = "https://";

bool is_secure_http(const std::string& url) {
    const std::string prefix = kSecureScheme;
    if (url.size() < prefix.size())
        return false;
    return std::equal(prefix.begin(), prefix.end(), url.begin(), [](char a, char b) {
        return a == std::tolower(static_cast<unsigned char>(b));
    });
}

// Percent-encode everything outside RFC 3986 "unreserved" so that '@', ':'
// and '/' inside a secret cannot break the authority component.
std::string encode_userinfo(const std::string& in) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(in.size());
    for (unsigned char c : in) {
        if (std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~') {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0x0F];
        }
    }
    return out;
}

// Splice @p userinfo after the scheme delimiter, replacing any userinfo the
// URL already carries.
std::string splice_userinfo(const std::string& url, const std::string& userinfo) {
    const size_t start = url.find("://") + 3;
    size_t host_end = url.find_first_of("/?#", start);
    if (host_end == std::string::npos)
        host_end = url.size();
    size_t at = url.rfind('@', host_end);
    size_t authority = (at != std::string::npos && at >= start) ? at + 1 : start;
    return url.substr(0, start) + userinfo + "@" + url.substr(authority);
}

std::string shell_quote(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'')
            out += "'\\''";
        else
            out += c;
    }
    out += "'";
    return out;
}

void add_secret(std::vector<std::string>& secrets, const std::string& raw) {
    if (raw.empty())
        return;
    secrets.push_back(raw);
    std::string enc = encode_userinfo(raw);
    if (enc != raw)
        secrets.push_back(enc);
}

struct Preparer {
    const std::string& url;

    PreparedEndpoint operator()(const NoAuth&) const { return {url, {}, {}}; }

    PreparedEndpoint operator()(const TokenAuth& a) const {
        PreparedEndpoint out{url, {}, {}};
        add_secret(out.secrets, a.token);
        if (is_secure_http(url))
            out.url = splice_userinfo(url, encode_userinfo(a.token));
        return out;
    }

    PreparedEndpoint operator()(const BasicAuth& a) const {
        PreparedEndpoint out{url, {}, {}};
        add_secret(out.secrets, a.password);
        if (is_secure_http(url))
            out.url = splice_userinfo(url, encode_userinfo(a.username) + ":" +
                                               encode_userinfo(a.password));
        return out;
    }

    PreparedEndpoint operator()(const SshAuth& a) const {
        PreparedEndpoint out{url, {}, {}};
        if (!a.key_path)
            return out;
        out.env[kSshCommandVar] =
            "ssh -i " + shell_quote(a.key_path->string()) + " -o StrictHostKeyChecking=no";
        return out;
    }
};

struct Validator {
    void operator()(const NoAuth&) const {}
    void operator()(const TokenAuth& a) const {
        if (a.token.empty())
            throw CredentialError("token authentication requires a non-empty token");
    }
    void operator()(const BasicAuth& a) const {
        if (a.username.empty() || a.password.empty())
            throw CredentialError("basic authentication requires username and password");
    }
    void operator()(const SshAuth& a) const {
        std::error_code ec;
        if (a.key_path && (a.key_path->empty() || !fs::exists(*a.key_path, ec)))
            throw CredentialError("ssh key not found: " + a.key_path->string());
    }
};

} // namespace

PreparedEndpoint prepare_endpoint(const std::string& url, const AuthCredential& credential) {
    validate_credential(credential);
    return std::visit(Preparer{url}, credential);
}

void validate_credential(const AuthCredential& credential) { std::visit(Validator{}, credential); }

std::string redact_url(const std::string& url) {
    const size_t scheme = url.find("://");
    if (scheme == std::string::npos)
        return url;
    const size_t start = scheme + 3;
    size_t host_end = url.find_first_of("/?#", start);
    if (host_end == std::string::npos)
        host_end = url.size();
    size_t at = url.rfind('@', host_end);
    if (at == std::string::npos || at < start)
        return url;
    return url.substr(0, start) + "***" + url.substr(at);
}

std::string redact_secrets(std::string text, const std::vector<std::string>& secrets) {
    for (const auto& s : secrets) {
        if (s.empty())
            continue;
        size_t pos = 0;
        while ((pos = text.find(s, pos)) != std::string::npos) {
            text.replace(pos, s.size(), "***");
            pos += 3;
        }
    }
    return text;
}

} // namespace gitmigrate
