/**
 * @file KineticProfile.cpp
 * @brief Implementation of KineticProfileCatalog.
 */

#include "domain/KineticProfile.hpp"
#include "domain/ShelfLifeErrors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace shelfsense::domain {

namespace {

constexpr double kAbsoluteZeroC = -273.15;

void ValidateProfile(const std::string& key, const KineticProfile& profile) {
    if (key.empty()) {
        throw std::invalid_argument("KineticProfileCatalog: Product key cannot be empty.");
    }
    if (!std::isfinite(profile.activationEnergy) || profile.activationEnergy <= 0.0) {
        throw std::invalid_argument("KineticProfileCatalog: Activation energy must be positive for '" + key + "'.");
    }
    if (!std::isfinite(profile.preExponentialFactor) || profile.preExponentialFactor <= 0.0) {
        throw std::invalid_argument("KineticProfileCatalog: Pre-exponential factor must be positive for '" + key + "'.");
    }
    if (!std::isfinite(profile.referenceShelfLifeDays) || profile.referenceShelfLifeDays <= 0.0) {
        throw std::invalid_argument("KineticProfileCatalog: Reference shelf life must be positive for '" + key + "'.");
    }
    if (!std::isfinite(profile.referenceTemperatureC) || profile.referenceTemperatureC <= kAbsoluteZeroC) {
        throw std::invalid_argument("KineticProfileCatalog: Reference temperature is below absolute zero for '" + key + "'.");
    }
}

} // namespace

std::string NormalizeProductKey(const std::string& product) {
    auto begin = std::find_if_not(product.begin(), product.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(product.rbegin(), product.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    if (begin >= end) return {};

    std::string key(begin, end);
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return key;
}

KineticProfileCatalog::KineticProfileCatalog(const std::map<std::string, KineticProfile>& profiles) {
    for (const auto& [name, profile] : profiles) {
        std::string key = NormalizeProductKey(name);
        ValidateProfile(key, profile);
        m_profiles[key] = profile;
    }
}

const std::map<std::string, KineticProfile>& KineticProfileCatalog::BuiltInProfiles() {
    static const std::map<std::string, KineticProfile> table = {
        {"apple",  {70000.0, 2.0e11, 60.0, 5.0}},
        {"banana", {62000.0, 9.0e9,  14.0, 5.0}},
        {"tomato", {36000.0, 1.5e5,  14.0, 5.0}},
        {"mango",  {46000.0, 2.5e7,  12.0, 5.0}},
        {"potato", {60000.0, 4.0e10, 90.0, 5.0}},
    };
    return table;
}

KineticProfileCatalog KineticProfileCatalog::BuiltIn() {
    return KineticProfileCatalog(BuiltInProfiles());
}

const KineticProfile& KineticProfileCatalog::at(const std::string& product) const {
    auto it = m_profiles.find(NormalizeProductKey(product));
    if (it == m_profiles.end()) {
        throw UnsupportedProductError(product);
    }
    return it->second;
}

bool KineticProfileCatalog::contains(const std::string& product) const {
    return m_profiles.count(NormalizeProductKey(product)) > 0;
}

std::vector<std::string> KineticProfileCatalog::products() const {
    std::vector<std::string> keys;
    keys.reserve(m_profiles.size());
    for (const auto& entry : m_profiles) {
        keys.push_back(entry.first);
    }
    return keys;
}

} // namespace shelfsense::domain
