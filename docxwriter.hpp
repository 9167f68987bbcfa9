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

#include <docmodel.hpp>
#include <tinyxml2.h>

#include <string>
#include <vector>

struct PackagePart {
    std::string name;
    std::string content;
};

// Renders a finished document into WordprocessingML parts and packages
// them. Never modifies the document, so it can be run any number of times.
class DocxWriter {
public:
    explicit DocxWriter(const Document &d);

    std::vector<PackagePart> build_parts() const;
    std::string build_package() const;
    void write(const char *ofilename) const;

private:
    struct MarginalPart {
        PageRegion region;
        bool first_page;
        std::string part_name;
        std::string rel_id;
        const Marginal *content; // Null for an empty first page variant.
    };

    std::vector<MarginalPart> marginal_parts() const;

    std::string content_types_xml(const std::vector<MarginalPart> &marginals) const;
    std::string package_rels_xml() const;
    std::string core_xml() const;
    std::string app_xml() const;
    std::string document_xml(const std::vector<MarginalPart> &marginals) const;
    std::string document_rels_xml(const std::vector<MarginalPart> &marginals) const;
    std::string styles_xml() const;
    std::string settings_xml() const;
    std::string marginal_xml(const MarginalPart &part) const;

    void write_paragraph(tinyxml2::XMLElement *parent, const StyledParagraph &par) const;
    void write_table(tinyxml2::XMLElement *body, const StyledTable &table) const;
    void write_page_break(tinyxml2::XMLElement *body) const;
    void write_section_properties(tinyxml2::XMLElement *body,
                                  const std::vector<MarginalPart> &marginals) const;

    const Document &doc;
    const SectionGeometry &geom;
};
