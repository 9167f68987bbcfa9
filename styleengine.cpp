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

#include <styleengine.hpp>
#include <docerrors.hpp>

#include <glib.h>

#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace {

StyleRecord base_record(const StyleConfig &config) {
    StyleRecord r;
    r.font_family = config.font_family;
    r.east_asia_font = config.font_family;
    r.font_size = config.font_size;
    r.line_spacing = config.line_spacing;
    r.space_before = Length::zero();
    r.space_after = Length::zero();
    return r;
}

} // namespace

StyleConfig gost_style_config() {
    StyleConfig c;
    c.font_family = "Times New Roman";
    c.font_size = Length::from_pt(14);
    c.line_spacing = 1.5;
    c.compact_line_spacing = 1.0;
    c.first_line_indent = Length::from_cm(1.25);
    c.heading1_space_after = Length::from_pt(12);
    c.heading2_space_before = Length::from_pt(12);
    c.heading2_space_after = Length::from_pt(6);
    c.list_bullet = "–";
    return c;
}

StyleRecord style_for(BlockKind kind, const StyleFlags &flags, const StyleConfig &config) {
    StyleRecord r = base_record(config);
    switch(kind) {
    case BlockKind::Heading1:
        r.alignment = TextAlignment::Centered;
        r.bold = true;
        r.uppercase = true;
        r.space_after = config.heading1_space_after;
        r.first_line_indent = Length::zero();
        break;
    case BlockKind::Heading2:
        r.alignment = TextAlignment::Justified;
        r.bold = true;
        r.space_before = config.heading2_space_before;
        r.space_after = config.heading2_space_after;
        r.first_line_indent = config.first_line_indent;
        break;
    case BlockKind::Body:
        r.alignment = TextAlignment::Justified;
        r.bold = flags.bold;
        r.first_line_indent = flags.indented ? config.first_line_indent : Length::zero();
        break;
    case BlockKind::ListItem:
        r.alignment = TextAlignment::Justified;
        r.first_line_indent = config.first_line_indent;
        if(flags.ordinal) {
            r.prefix = std::to_string(*flags.ordinal) + ") ";
        } else {
            r.prefix = config.list_bullet + " ";
        }
        break;
    case BlockKind::TocEntry:
        r.alignment = TextAlignment::Justified;
        r.first_line_indent = Length::zero();
        r.toc_tabs = true;
        break;
    case BlockKind::Reference:
        r.alignment = TextAlignment::Justified;
        r.first_line_indent = Length::zero();
        if(flags.ordinal) {
            r.prefix = std::to_string(*flags.ordinal) + ". ";
        }
        break;
    case BlockKind::TitleLine:
        r.alignment = flags.alignment;
        r.bold = flags.bold;
        r.line_spacing = config.compact_line_spacing;
        break;
    case BlockKind::TableCell:
        r.alignment = TextAlignment::Left;
        r.bold = flags.bold;
        r.line_spacing = config.compact_line_spacing;
        break;
    default:
        printf("Unknown block kind %d.\n", int(kind));
        std::abort();
    }
    return r;
}

std::string utf8_uppercase(const std::string &text) {
    if(!g_utf8_validate(text.c_str(), text.size(), nullptr)) {
        throw DocError("Text to uppercase is not valid UTF-8.");
    }
    gchar *upper = g_utf8_strup(text.c_str(), text.size());
    std::string result(upper, strlen(upper));
    g_free(upper);
    return result;
}

std::string render_text(const StyleRecord &style, const std::string &text) {
    std::string result = style.prefix;
    result += style.uppercase ? utf8_uppercase(text) : text;
    return result;
}

bool has_subsection_prefix(const std::string &title) {
    size_t i = 0;
    while(i < title.size() && title[i] >= '0' && title[i] <= '9') {
        ++i;
    }
    return i > 0 && i < title.size() && title[i] == '.';
}

const char *alignment_name(TextAlignment a) {
    switch(a) {
    case TextAlignment::Left:
        return "left";
    case TextAlignment::Centered:
        return "center";
    case TextAlignment::Justified:
        return "both";
    }
    return "left";
}
