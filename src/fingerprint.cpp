#include "fingerprint.hpp"
#include "originClient.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <openssl/evp.h>

std::string fingerprintSource(const RequestEvent &req, const std::vector<std::string> &declaredHeaders) {
    std::vector<std::string> names;
    for (const auto &h : declaredHeaders) names.push_back(toLowerCopy(h));
    std::sort(names.begin(), names.end());
    names.erase(std::unique(names.begin(), names.end()), names.end());

    std::string method = req.method;
    std::transform(method.begin(), method.end(), method.begin(),
                   [](unsigned char c){ return (char)std::toupper(c); });

    std::ostringstream oss;
    oss << method << "\n" << normalizePath(req.path()) << "\n" << req.query() << "\n";
    for (const auto &name : names) {
        std::vector<std::string> values = req.headers.getAll(name);
        if (values.empty()) continue;
        oss << name << ":";
        for (size_t i = 0; i < values.size(); ++i) {
            if (i) oss << ",";
            oss << values[i];
        }
        oss << "\n";
    }
    return oss.str();
}

std::string sha256Hex(const std::string &data) {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;

    if (!ctx ||
        EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest, &len) != 1) {
        throw std::runtime_error("SHA-256 digest failed");
    }

    std::ostringstream oss;
    for (unsigned int i = 0; i < len; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0') << (int)digest[i];
    }
    return oss.str();
}

std::string computeFingerprint(const RequestEvent &req, const std::vector<std::string> &declaredHeaders) {
    return sha256Hex(fingerprintSource(req, declaredHeaders));
}
