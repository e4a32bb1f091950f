#pragma once

#include "analysis.hpp"

#include <mutex>
#include <string_view>

namespace quarry {

    /*
     * Write path into the engine
     *
     * Each operation is independent of report generation and of every other call. Neither ever throws: address
     * and type parse failures, missing symbols or data, and faults raised by the engine's mutation calls all come
     * back as {success: false, message}. Writes go through a single mutex so one mutation_ops instance can be
     * shared by concurrent callers.
     */
    class mutation_ops {
      public:
        explicit mutation_ops(program_model& model);

        // Renames the first symbol bound at `address_text`; provenance becomes user-defined
        mutation_result rename_symbol(std::string_view address_text, std::string_view new_name);

        // Retypes existing data only; undefined bytes and code are rejected before the type is parsed
        mutation_result set_data_type(std::string_view address_text, std::string_view type_text);

      private:
        program_model& model;
        std::mutex write_mutex{};
    };

}  // namespace quarry
