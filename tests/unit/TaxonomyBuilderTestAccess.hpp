#pragma once

#include "TaxonomyBuilder.hpp"

#include <optional>
#include <string>
#include <vector>

class TaxonomyBuilderTestAccess {
public:
    static std::vector<MergeGrouping> parse_merge_suggestions(const std::string& response) {
        return TaxonomyBuilder::parse_merge_suggestions(response);
    }

    static std::optional<std::vector<SubcategoryProposal>> parse_sub_structure(const std::string& response) {
        return TaxonomyBuilder::parse_sub_structure(response);
    }

    static std::string clean_category_name(const std::string& response) {
        return TaxonomyBuilder::clean_category_name(response);
    }

    static std::string build_naming_prompt(const std::string& current_name,
                                           const std::vector<std::string>& filenames) {
        return TaxonomyBuilder::build_naming_prompt(current_name, filenames);
    }
};
