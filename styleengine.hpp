/*
 * Copyright 2022 Jussi Pakkanen
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#pragma once

#include <units.hpp>

#include <optional>
#include <string>
#include <cstdint>

enum class TextAlignment : int {
    Left,
    Centered,
    Justified,
};

enum class BlockKind : int {
    Heading1,
    Heading2,
    Body,
    ListItem,
    TocEntry,
    Reference,
    TitleLine,
    TableCell,
};

struct StyleFlags {
    bool bold = false;
    bool indented = true;
    std::optional<int> ordinal;
    // Only TitleLine honors this, every other kind has a fixed alignment.
    TextAlignment alignment = TextAlignment::Left;
};

// Values mandated by the formatting standard. Every kind derives its
// record from these so that a different standard is a different config.
struct StyleConfig {
    std::string font_family;
    Length font_size;
    double line_spacing;
    double compact_line_spacing;
    Length first_line_indent;
    Length heading1_space_after;
    Length heading2_space_before;
    Length heading2_space_after;
    std::string list_bullet;
};

StyleConfig gost_style_config();

struct StyleRecord {
    std::string font_family;
    std::string east_asia_font;
    Length font_size;
    bool bold = false;
    TextAlignment alignment = TextAlignment::Left;
    double line_spacing = 1.0;
    Length space_before;
    Length space_after;
    std::optional<Length> first_line_indent; // Unset means inherit the default.
    bool uppercase = false;
    std::string prefix;
    bool toc_tabs = false;

    bool operator==(const StyleRecord &o) const = default;
};

StyleRecord style_for(BlockKind kind, const StyleFlags &flags, const StyleConfig &config);

// Text as it appears in the document: prefix prepended, case transformed.
std::string render_text(const StyleRecord &style, const std::string &text);

std::string utf8_uppercase(const std::string &text);

// "1.1 Foo" is nested under "1 FOO" in the table of contents.
bool has_subsection_prefix(const std::string &title);

const char *alignment_name(TextAlignment a);
