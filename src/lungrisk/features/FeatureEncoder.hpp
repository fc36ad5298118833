#pragma once

#include <string>
#include <utility>
#include <vector>

#include "lungrisk/features/FeatureSchema.hpp"
#include "lungrisk/features/RawValue.hpp"
#include "lungrisk/math/Probability.hpp"

namespace lungrisk::features {

struct EncodedFeatures {
    FeatureVector values;                                  // pre-scale, FeatureOrder
    std::vector<std::pair<std::string, double>> inputsUsed; // same values keyed by name
};

class FeatureEncoder {
public:
    explicit FeatureEncoder(FeatureSchema schema) : schema_(std::move(schema)) {}

    // Never fails: absent or malformed fields fall back to 0.0 / 0
    EncodedFeatures encode(const RawAttributeSet& raw) const {
        EncodedFeatures out;
        out.values = FeatureVector::Zero(static_cast<Eigen::Index>(schema_.order.size()));
        out.inputsUsed.reserve(schema_.order.size());
        for (size_t i = 0; i < schema_.order.size(); ++i) {
            const std::string& name = schema_.order[i];
            const RawValue& v = lookup(raw, name);
            double x = schema_.isNumeric(name)
                           ? parseNumeric(v, 0.0)
                           : static_cast<double>(parseBinary(v, schema_.meaningOf(name)));
            out.values[static_cast<Eigen::Index>(i)] = x;
            out.inputsUsed.emplace_back(name, x);
        }
        return out;
    }

    const FeatureSchema& schema() const { return schema_; }

private:
    const RawValue& lookup(const RawAttributeSet& raw, const std::string& name) const {
        static const RawValue kAbsent{};
        auto it = raw.find(name);
        if (it != raw.end()) return it->second;
        for (const auto& [alias, canonical] : schema_.aliases) {
            if (canonical != name) continue;
            auto a = raw.find(alias);
            if (a != raw.end()) return a->second;
        }
        return kAbsent;
    }

    FeatureSchema schema_;
};

} // namespace lungrisk::features
