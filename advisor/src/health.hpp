#pragma once

#include "config.hpp"
#include "universe.hpp"
#include <nlohmann/json.hpp>
#include <memory>

class HealthCheck {
public:
    HealthCheck(const Config& config, std::shared_ptr<CatalogStore> catalog);

    nlohmann::json get_status() const;
    bool is_healthy() const;

private:
    const Config& config_;
    std::shared_ptr<CatalogStore> catalog_;
};
