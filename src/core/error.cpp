// ============================================================================
// heir/core/error.cpp - Error Category Implementation
// ============================================================================

#include "heir/core/error.hpp"

#include <string>

namespace heir {

namespace {

class HeirCategoryImpl : public std::error_category {
   public:
    const char* name() const noexcept override { return "heir"; }

    std::string message(int ev) const override {
        switch (static_cast<Errc>(ev)) {
            case Errc::NotSet:
                return "Inheritable local is not set in this task";
            case Errc::NoExecutor:
                return "No executor available to spawn on";
            default:
                return "Unknown heir error";
        }
    }
};

}  // namespace

const std::error_category& HeirCategory() noexcept {
    static const HeirCategoryImpl instance;
    return instance;
}

std::error_code make_error_code(Errc e) noexcept {
    return {static_cast<int>(e), HeirCategory()};
}

}  // namespace heir
