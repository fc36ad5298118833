#pragma once

#include <algorithm>
#include <map>
#include <string>
#include <vector>

#include "lungrisk/features/RawValue.hpp"

namespace lungrisk::features {

// Column contract shared by training and serving. FeatureOrder is fixed at training time.
struct FeatureSchema {
    std::vector<std::string> order;
    std::vector<std::string> numericCols;
    std::map<std::string, BinaryMeaning> binaryMeaning;
    std::string target{"lung_cancer"};
    // Alternative request names -> canonical column name
    std::map<std::string, std::string> aliases;

    bool isNumeric(const std::string& name) const {
        return std::find(numericCols.begin(), numericCols.end(), name) != numericCols.end();
    }

    // Binary columns in FeatureOrder
    std::vector<std::string> binaryCols() const {
        std::vector<std::string> out;
        for (const auto& name : order) {
            if (!isNumeric(name)) out.push_back(name);
        }
        return out;
    }

    std::vector<int> numericIndices() const {
        std::vector<int> out;
        for (int i = 0; i < static_cast<int>(order.size()); ++i) {
            if (isNumeric(order[i])) out.push_back(i);
        }
        return out;
    }

    const BinaryMeaning* meaningOf(const std::string& name) const {
        auto it = binaryMeaning.find(name);
        return it == binaryMeaning.end() ? nullptr : &it->second;
    }
};

inline FeatureSchema lungCancerSchema() {
    FeatureSchema s;
    s.order = {"age", "pack_years", "gender", "radon_exposure", "asbestos_exposure",
               "secondhand_smoke_exposure", "copd_diagnosis", "alcohol_consumption", "family_history"};
    s.numericCols = {"age", "pack_years"};
    for (const auto& name : s.binaryCols()) {
        s.binaryMeaning[name] = BinaryMeaning{"yes", "no"};
    }
    s.binaryMeaning["gender"] = BinaryMeaning{"male", "female"};
    s.target = "lung_cancer";
    s.aliases = {
        {"exposure_years", "pack_years"},
        {"radon", "radon_exposure"},
        {"asbestos", "asbestos_exposure"},
        {"secondhand", "secondhand_smoke_exposure"},
        {"secondhand_smoke", "secondhand_smoke_exposure"},
        {"copd", "copd_diagnosis"},
        {"alcohol", "alcohol_consumption"},
    };
    return s;
}

} // namespace lungrisk::features
