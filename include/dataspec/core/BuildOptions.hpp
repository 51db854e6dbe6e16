#pragma once

namespace DS {

struct BuildOptions {
    // Accept an explicit null as the attribute value.
    bool allowNull = false;
    // Tolerate and discard unrecognized keys instead of rejecting them.
    bool ignoreExtraKeys = false;
    // Nested Element attributes may be null (sets built from sparse annotation tables).
    bool permitNullAttributes = false;

    static auto Nullable() -> BuildOptions {
        return BuildOptions{.allowNull = true};
    }

    auto nullable(bool enabled = true) -> BuildOptions& {
        allowNull = enabled;
        return *this;
    }

    auto ignoreExtras(bool enabled = true) -> BuildOptions& {
        ignoreExtraKeys = enabled;
        return *this;
    }

    auto permitNullInElements(bool enabled = true) -> BuildOptions& {
        permitNullAttributes = enabled;
        return *this;
    }
};

struct DifferenceOptions {
    // Keep an element whose id appears in the other set when its attributes differ there.
    bool compareAttributes = false;
};

} // namespace DS
