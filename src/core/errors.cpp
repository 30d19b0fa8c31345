#include "../../include/core/errors.hpp"

namespace ctp {

    namespace {
        class EngineCategory : public boost::system::error_category {
        public:
            const char* name() const noexcept override { return "ctproxy"; }

            std::string message(int ev) const override {
                switch (static_cast<errc>(ev)) {
                    case errc::invalid_uri: return "rewrite produced an invalid uri";
                }
                return "unknown ctproxy error";
            }
        };
    }

    const boost::system::error_category& engine_category() noexcept {
        static EngineCategory category;
        return category;
    }
}
