#pragma once

#include <string>

namespace savings {
namespace domain {

// Identity of a caller or balance holder (user, admin, or the pool itself).
using AccountId = std::string;

// Identifier of a base asset, e.g. "MTK". One market per asset.
using AssetId = std::string;

}  // namespace domain
}  // namespace savings
