#ifndef FINGERPRINT_HPP
#define FINGERPRINT_HPP

#include "eventModel.hpp"
#include <string>
#include <vector>

// Canonical text hashed into a fingerprint:
// method, normalized path, query, then "name:value" for each declared header present.
std::string fingerprintSource(const RequestEvent &req, const std::vector<std::string> &declaredHeaders);

// Lowercase hex SHA-256 of fingerprintSource(). Safe to use as a file name.
std::string computeFingerprint(const RequestEvent &req, const std::vector<std::string> &declaredHeaders);

std::string sha256Hex(const std::string &data);

#endif // FINGERPRINT_HPP
