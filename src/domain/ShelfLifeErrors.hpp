/**
 * @file ShelfLifeErrors.hpp
 * @brief Typed failures raised by the shelf-life engine.
 */

#pragma once
#include <stdexcept>
#include <string>

namespace shelfsense::domain {

/**
 * @class UnsupportedProductError
 * @brief The requested product has no kinetic profile.
 */
class UnsupportedProductError : public std::invalid_argument {
public:
    explicit UnsupportedProductError(const std::string& product)
        : std::invalid_argument("Unsupported product type '" + product + "' for shelf-life prediction"),
          m_product(product) {}

    const std::string& product() const { return m_product; }

private:
    std::string m_product;
};

/**
 * @class InvalidModelSchemaError
 * @brief The learned regressor does not declare a usable feature schema.
 */
class InvalidModelSchemaError : public std::runtime_error {
public:
    explicit InvalidModelSchemaError(const std::string& what)
        : std::runtime_error("Invalid model schema: " + what) {}
};

/**
 * @class EnvironmentUnavailableError
 * @brief Neither overrides nor telemetry could resolve temperature/humidity.
 */
class EnvironmentUnavailableError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace shelfsense::domain
