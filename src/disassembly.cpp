#include "quarry/analysis.hpp"

#include <algorithm>

namespace quarry {

    std::vector<instruction_record> walk_disassembly(
            const program_model& model, address start, uint32_t max_instructions) {
        std::vector<instruction_record> instructions{};
        instructions.reserve(std::min(max_instructions, 1024U));

        auto cursor = start;
        while (instructions.size() < max_instructions) {
            auto instruction = model.instruction_at(cursor);
            if (!instruction) {
                debug_log("disassembly gap at ", cursor.to_string(), " after ", instructions.size(), " instructions");
                break;
            }

            instructions.push_back(instruction_record{
                    .address = instruction->addr.to_string(),
                    .mnemonic = instruction->mnemonic,
                    .operands = instruction->operands,
                    .bytes = format_instruction_bytes(instruction->bytes),
                    .comment = model.comment_at(cursor, comment_kind::eol).value_or(std::string{})});

            if (instruction->length == 0U) {
                break;
            }
            auto next = cursor.advanced(instruction->length);
            if (!next) {
                break;
            }
            cursor = *next;
        }

        return instructions;
    }

}  // namespace quarry
