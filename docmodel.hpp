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
#include <styleengine.hpp>

#include <optional>
#include <string>
#include <vector>
#include <variant>

// Input blocks, as handed to the composer.

struct Heading {
    int level;
    std::string text;
};

struct Paragraph {
    std::string text;
    bool bold = false;
    bool indented = true;
};

struct ListItem {
    std::string text;
    std::optional<int> ordinal;
};

struct PageBreak {};

struct Table {
    std::vector<std::string> header;
    std::vector<std::vector<std::string>> rows;
};

struct TocEntry {
    std::string title;
    std::string page;
};

struct ReferenceEntry {
    std::string text;
};

struct TitleLine {
    std::string text;
    TextAlignment alignment = TextAlignment::Centered;
    bool bold = false;
};

typedef std::variant<Heading,
                     Paragraph,
                     ListItem,
                     PageBreak,
                     Table,
                     TocEntry,
                     ReferenceEntry,
                     TitleLine>
    Block;

struct SectionGeometry {
    Length page_width;
    Length page_height;
    Length left;
    Length right;
    Length top;
    Length bottom;
    Length header_distance;
    Length footer_distance;
    bool different_first_page = false;

    Length text_width() const { return page_width - left - right; }
};

SectionGeometry gost_geometry();

// Low level run content. A field is a begin/instruction/end triplet
// that must stay contiguous inside a single run.

struct TextNode {
    std::string text;
};

struct FieldBegin {};

struct FieldInstruction {
    std::string instruction;
};

struct FieldEnd {};

typedef std::variant<TextNode, FieldBegin, FieldInstruction, FieldEnd> RunNode;

struct Run {
    StyleRecord style;
    std::vector<RunNode> nodes;
};

enum class PageRegion : int {
    Header,
    Footer,
};

struct Marginal {
    TextAlignment alignment = TextAlignment::Centered;
    std::vector<Run> runs;
};

// Resolved elements, in reading order.

struct StyledParagraph {
    StyleRecord style;
    std::string text; // Already passed through render_text.
};

struct StyledTable {
    std::vector<std::vector<StyledParagraph>> rows;

    size_t num_columns() const { return rows.empty() ? 0 : rows.front().size(); }
};

struct PageBreakMark {};

typedef std::variant<StyledParagraph, StyledTable, PageBreakMark> DocElement;

struct DocumentInfo {
    std::string title;
    std::string author;
    std::string language = "ru-RU";
};

struct Document {
    std::optional<SectionGeometry> geometry;
    std::vector<DocElement> elements;
    std::optional<Marginal> header;
    std::optional<Marginal> footer;
    DocumentInfo info;
    StyleConfig config;
};
