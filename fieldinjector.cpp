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

#include <fieldinjector.hpp>

namespace {

const char page_instruction[] = "PAGE";

}

FieldNodes build_page_number_field() {
    return FieldNodes{RunNode{FieldBegin{}},
                      RunNode{FieldInstruction{page_instruction}},
                      RunNode{FieldEnd{}}};
}

void inject_page_number_field(Run &run) {
    const auto field = build_page_number_field();
    run.nodes.insert(run.nodes.end(), field.begin(), field.end());
}

bool is_page_number_field(const std::vector<RunNode> &nodes, size_t start) {
    if(start + 3 > nodes.size()) {
        return false;
    }
    if(!std::holds_alternative<FieldBegin>(nodes[start])) {
        return false;
    }
    auto *instr = std::get_if<FieldInstruction>(&nodes[start + 1]);
    if(!instr || instr->instruction != page_instruction) {
        return false;
    }
    return std::holds_alternative<FieldEnd>(nodes[start + 2]);
}
