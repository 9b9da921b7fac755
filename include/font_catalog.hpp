//
//  font_catalog.hpp
//  CaptionForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace captionforge {

/**
 * @brief Font display names known to the renderer, with their font resource.
 *
 * The catalog is only queried to validate a style's font name; it never resolves fonts on
 * its own. Build one explicitly (or start from `bundled()`) and hand it to the compiler.
 */
class FontCatalog {
public:
    FontCatalog() = default;

    /// Catalog of the fonts shipped next to the renderer, keyed by display name.
    static FontCatalog bundled();

    /// Register (or replace) a display name. `resource` may be empty when only the name matters.
    void add(const std::string &display_name, const std::string &resource = {});

    bool contains(const std::string &display_name) const;
    std::optional<std::string> resource_for(const std::string &display_name) const;

    /// Display names in lexicographic order.
    std::vector<std::string> names() const;
    size_t size() const { return fonts_.size(); }

private:
    std::map<std::string, std::string> fonts_;
};

}  // namespace captionforge
