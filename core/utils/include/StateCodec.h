#pragma once

#include "Result.h"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace BehaviorSentinel {

    /**
     * @brief Comma-separated, version-tagged text records for agent state
     *
     * Layout: `v1,<field>,<field>,...`. Doubles are written with
     * max_digits10 so that decode(encode(x)) == x.
     */
    class StateWriter {
    public:
        StateWriter();

        StateWriter& add(double value);
        StateWriter& add(int64_t value);
        StateWriter& add(bool value);

        const std::string& str() const { return buffer_; }

    private:
        std::string buffer_;
    };

    class StateReader {
    public:
        static constexpr const char* VERSION_TAG = "v1";

        /**
         * @brief Split a record, checking version tag and field count
         */
        static Result<StateReader> open(const std::string& text, size_t expectedFields);

        Result<double> nextDouble();
        Result<int64_t> nextInt();
        Result<bool> nextBool();

    private:
        explicit StateReader(std::vector<std::string> fields) : fields_(std::move(fields)) {}

        Result<std::string> nextField();

        std::vector<std::string> fields_;
        size_t position_ = 0;
    };

}
