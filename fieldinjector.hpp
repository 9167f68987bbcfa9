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

#include <array>

typedef std::array<RunNode, 3> FieldNodes;

// Always FieldBegin, FieldInstruction("PAGE"), FieldEnd.
FieldNodes build_page_number_field();

// Appends the page number field to the end of the run. Only meant for
// header and footer runs.
void inject_page_number_field(Run &run);

bool is_page_number_field(const std::vector<RunNode> &nodes, size_t start);
