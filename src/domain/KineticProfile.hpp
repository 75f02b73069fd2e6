/**
 * @file KineticProfile.hpp
 * @brief Per-product Arrhenius constants and the immutable catalog holding them.
 */

#pragma once
#include <map>
#include <string>
#include <vector>

namespace shelfsense::domain {

/**
 * @struct KineticProfile
 * @brief Arrhenius parameters of a product category.
 */
struct KineticProfile {
    double activationEnergy = 0.0;       ///< Ea in J/mol.
    double preExponentialFactor = 0.0;   ///< A, rate constant scale.
    double referenceShelfLifeDays = 0.0; ///< Shelf life observed at the reference temperature.
    double referenceTemperatureC = 5.0;  ///< Temperature at which the reference life holds.
};

/** @brief Trims surrounding whitespace and lower-cases a product name. */
std::string NormalizeProductKey(const std::string& product);

/**
 * @class KineticProfileCatalog
 * @brief Read-only lookup of kinetic profiles keyed by normalized product name.
 *
 * Profiles are validated once on construction; the catalog cannot be
 * modified afterwards.
 */
class KineticProfileCatalog {
public:
    /**
     * @brief Builds a catalog from the given profiles.
     * @throws std::invalid_argument if a key is empty or a profile is not physically meaningful.
     */
    explicit KineticProfileCatalog(const std::map<std::string, KineticProfile>& profiles);

    /** @brief The table shipped with the engine (apple, banana, tomato, mango, potato). */
    static const std::map<std::string, KineticProfile>& BuiltInProfiles();

    /** @brief Convenience: a catalog holding only the built-in table. */
    static KineticProfileCatalog BuiltIn();

    /**
     * @brief Looks up a profile by product name (case-insensitive).
     * @throws UnsupportedProductError if no profile exists.
     */
    const KineticProfile& at(const std::string& product) const;

    bool contains(const std::string& product) const;

    /** @brief Sorted list of supported product keys. */
    std::vector<std::string> products() const;

    std::size_t size() const { return m_profiles.size(); }

private:
    std::map<std::string, KineticProfile> m_profiles;
};

} // namespace shelfsense::domain
