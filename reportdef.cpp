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

#include <reportdef.hpp>
#include <docerrors.hpp>

#include <nlohmann/json.hpp>
#include <glib.h>

#include <fstream>
#include <unordered_map>

using json = nlohmann::json;

namespace {

const std::unordered_map<std::string, TextAlignment> alignmap{
    {"left", TextAlignment::Left},
    {"center", TextAlignment::Centered},
    {"justify", TextAlignment::Justified}};

const json &get_value(const json &data, const char *key) {
    auto it = data.find(key);
    if(it == data.end()) {
        throw ConfigError(std::string("Missing required key ") + key + ".");
    }
    return *it;
}

std::string checked_string(const json &value, const char *key) {
    if(!value.is_string()) {
        throw ConfigError(std::string("Element ") + key + " is not a string.");
    }
    auto s = value.get<std::string>();
    if(!g_utf8_validate(s.c_str(), s.length(), nullptr)) {
        throw ConfigError(std::string("Element ") + key + " is not valid UTF-8.");
    }
    return s;
}

std::string get_string(const json &data, const char *key) {
    return checked_string(get_value(data, key), key);
}

std::string get_string(const json &data, const char *key, const std::string &fallback) {
    if(!data.contains(key)) {
        return fallback;
    }
    return get_string(data, key);
}

double get_double(const json &data, const char *key, double fallback) {
    if(!data.contains(key)) {
        return fallback;
    }
    const auto &value = get_value(data, key);
    if(!value.is_number()) {
        throw ConfigError(std::string("Element ") + key + " is not a number.");
    }
    return value.get<double>();
}

int get_int(const json &data, const char *key) {
    const auto &value = get_value(data, key);
    if(!value.is_number_integer()) {
        throw ConfigError(std::string("Element ") + key + " is not an integer.");
    }
    return value.get<int>();
}

bool get_bool(const json &data, const char *key, bool fallback) {
    if(!data.contains(key)) {
        return fallback;
    }
    const auto &value = get_value(data, key);
    if(!value.is_boolean()) {
        throw ConfigError(std::string("Element ") + key + " is not a boolean.");
    }
    return value.get<bool>();
}

std::vector<std::string> extract_stringarray(const json &arr, const char *entryname) {
    std::vector<std::string> result;
    if(!arr.is_array()) {
        throw ConfigError(std::string(entryname) + " must be an array of strings.");
    }
    for(const auto &e : arr) {
        result.push_back(checked_string(e, entryname));
    }
    return result;
}

std::vector<std::string>
get_stringarray(const json &data, const char *key, bool required = true) {
    if(!required && !data.contains(key)) {
        return {};
    }
    return extract_stringarray(get_value(data, key), key);
}

ReportMetadata parse_metadata(const json &data) {
    ReportMetadata m;
    m.student_name = get_string(data, "student_name");
    m.group = get_string(data, "group");
    m.teacher_name = get_string(data, "teacher_name");
    m.topic_title = get_string(data, "topic_title");
    m.year = get_string(data, "year");
    m.city = get_string(data, "city", "Москва");
    m.student_label = get_string(data, "student_label", "Студент:");
    m.teacher_label = get_string(data, "teacher_label", "Преподаватель:");
    m.organization = get_stringarray(data, "organization", false);
    m.work_type = get_string(data, "work_type", "КУРСОВОЙ ПРОЕКТ");
    m.topic_label = get_string(data, "topic_label", "по теме:");
    m.course = get_string(data, "course", "");
    m.program = get_stringarray(data, "program", false);
    if(data.contains("student_tabs")) {
        m.student_tabs = get_int(data, "student_tabs");
    }
    if(data.contains("teacher_tabs")) {
        m.teacher_tabs = get_int(data, "teacher_tabs");
    }
    return m;
}

// All distances are in millimetres.
SectionGeometry parse_geometry(const json &data) {
    SectionGeometry g = gost_geometry();
    auto mm = [&data](const char *key, Length fallback) {
        return Length::from_mm(get_double(data, key, fallback.mm()));
    };
    g.page_width = mm("page_width", g.page_width);
    g.page_height = mm("page_height", g.page_height);
    g.left = mm("left", g.left);
    g.right = mm("right", g.right);
    g.top = mm("top", g.top);
    g.bottom = mm("bottom", g.bottom);
    g.header_distance = mm("header", g.header_distance);
    g.footer_distance = mm("footer", g.footer_distance);
    g.different_first_page = get_bool(data, "unnumbered_title_page", g.different_first_page);
    return g;
}

StyleConfig parse_style(const json &data) {
    StyleConfig c = gost_style_config();
    c.font_family = get_string(data, "font", c.font_family);
    c.font_size = Length::from_pt(get_double(data, "size", c.font_size.pt()));
    c.line_spacing = get_double(data, "line_spacing", c.line_spacing);
    c.first_line_indent = Length::from_mm(get_double(data, "indent", c.first_line_indent.mm()));
    return c;
}

TextAlignment parse_alignment(const json &data) {
    const auto name = get_string(data, "align", "center");
    auto it = alignmap.find(name);
    if(it == alignmap.end()) {
        throw ConfigError("Unknown alignment \"" + name + "\".");
    }
    return it->second;
}

Block parse_block(const json &data) {
    if(!data.is_object()) {
        throw ConfigError("Content entries must be objects.");
    }
    const auto type = get_string(data, "type");
    if(type == "heading") {
        return Heading{data.contains("level") ? get_int(data, "level") : 1,
                       get_string(data, "text")};
    } else if(type == "paragraph") {
        return Paragraph{
            get_string(data, "text"), get_bool(data, "bold", false), get_bool(data, "indent", true)};
    } else if(type == "item") {
        ListItem item{get_string(data, "text"), std::nullopt};
        if(data.contains("number")) {
            item.ordinal = get_int(data, "number");
        }
        return item;
    } else if(type == "pagebreak") {
        return PageBreak{};
    } else if(type == "table") {
        Table t;
        t.header = get_stringarray(data, "header");
        const auto &rows = get_value(data, "rows");
        if(!rows.is_array()) {
            throw ConfigError("Table rows must be an array.");
        }
        for(const auto &row : rows) {
            t.rows.push_back(extract_stringarray(row, "rows"));
        }
        return t;
    } else if(type == "title") {
        return TitleLine{
            get_string(data, "text"), parse_alignment(data), get_bool(data, "bold", false)};
    }
    throw ConfigError("Unknown content type \"" + type + "\".");
}

std::vector<TocEntry> parse_toc(const json &data) {
    std::vector<TocEntry> toc;
    if(!data.is_array()) {
        throw ConfigError("toc must be an array of [title, page] pairs.");
    }
    for(const auto &e : data) {
        auto pair = extract_stringarray(e, "toc");
        if(pair.size() != 2) {
            throw ConfigError("toc entries must have exactly two elements.");
        }
        toc.push_back(TocEntry{std::move(pair[0]), std::move(pair[1])});
    }
    return toc;
}

} // namespace

ReportDefinition load_report_json(const char *path) {
    ReportDefinition def;
    std::filesystem::path json_file(path);
    def.top_dir = json_file.parent_path();
    std::ifstream ifile(path);
    if(ifile.fail()) {
        throw ConfigError(std::string("Could not open file ") + path + ".");
    }
    json data;
    try {
        data = json::parse(ifile);
    } catch(const json::exception &e) {
        throw ConfigError(std::string("Could not parse ") + path + ": " + e.what());
    }
    if(!data.is_object()) {
        throw ConfigError("Top level element must be an object.");
    }

    def.output = get_string(data, "output");
    def.meta = parse_metadata(get_value(data, "metadata"));
    def.geometry = data.contains("geometry") ? parse_geometry(data["geometry"]) : gost_geometry();
    def.style = data.contains("style") ? parse_style(data["style"]) : gost_style_config();
    def.page_numbers = get_bool(data, "page_numbers", true);
    def.toc_title = get_string(data, "toc_title", "СОДЕРЖАНИЕ");
    if(data.contains("toc")) {
        def.toc = parse_toc(data["toc"]);
    }
    const auto &content = get_value(data, "content");
    if(!content.is_array()) {
        throw ConfigError("content must be an array.");
    }
    for(const auto &e : content) {
        def.content.push_back(parse_block(e));
    }
    def.references_title = get_string(data, "references_title", "СПИСОК ИСПОЛЬЗОВАННЫХ ИСТОЧНИКОВ");
    def.references = get_stringarray(data, "references", false);
    return def;
}
