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
#include <styleengine.hpp>

#include <filesystem>
#include <string>
#include <vector>

struct ReportMetadata {
    std::string student_name;
    std::string group;
    std::string teacher_name;
    std::string topic_title;
    std::string year;
    std::string city;
    std::string student_label;
    std::string teacher_label;
    std::vector<std::string> organization;
    std::string work_type;
    std::string topic_label;
    std::string course;
    std::vector<std::string> program;
    // Tabs between a signature label and the name, chosen so that both
    // names start in the same column.
    int student_tabs = 9;
    int teacher_tabs = 8;
};

struct ReportDefinition {
    // Relative paths in the definition are relative to this.
    std::filesystem::path top_dir;
    std::string output;
    ReportMetadata meta;
    SectionGeometry geometry;
    StyleConfig style;
    bool page_numbers = true;
    std::string toc_title;
    std::vector<TocEntry> toc;
    std::vector<Block> content;
    std::string references_title;
    std::vector<std::string> references;
};

ReportDefinition load_report_json(const char *path);
