#include "StateCodec.h"
#include <limits>
#include <locale>
#include <sstream>

namespace BehaviorSentinel {

    StateWriter::StateWriter() : buffer_(StateReader::VERSION_TAG) {}

    StateWriter& StateWriter::add(double value) {
        std::ostringstream ss;
        ss.imbue(std::locale::classic());
        ss.precision(std::numeric_limits<double>::max_digits10);
        ss << value;
        buffer_ += ',';
        buffer_ += ss.str();
        return *this;
    }

    StateWriter& StateWriter::add(int64_t value) {
        buffer_ += ',';
        buffer_ += std::to_string(value);
        return *this;
    }

    StateWriter& StateWriter::add(bool value) {
        buffer_ += value ? ",1" : ",0";
        return *this;
    }

    Result<StateReader> StateReader::open(const std::string& text, size_t expectedFields) {
        std::vector<std::string> parts;
        std::string part;
        std::istringstream ss(text);
        while (std::getline(ss, part, ',')) {
            parts.push_back(part);
        }
        if (!text.empty() && text.back() == ',') {
            parts.emplace_back();
        }

        if (parts.empty() || parts.front() != VERSION_TAG) {
            return Err<StateReader>(ErrorCode::ParseError, "unsupported state version");
        }
        if (parts.size() != expectedFields + 1) {
            return Err<StateReader>(ErrorCode::ParseError,
                "expected " + std::to_string(expectedFields) + " state fields, got " +
                std::to_string(parts.size() - 1));
        }
        parts.erase(parts.begin());
        return StateReader(std::move(parts));
    }

    Result<std::string> StateReader::nextField() {
        if (position_ >= fields_.size()) {
            return Err<std::string>(ErrorCode::ParseError, "state record exhausted");
        }
        return fields_[position_++];
    }

    Result<double> StateReader::nextDouble() {
        auto field = nextField();
        if (!field) return field.error();

        std::istringstream ss(*field);
        ss.imbue(std::locale::classic());
        double value = 0.0;
        ss >> value;
        if (ss.fail() || !ss.eof()) {
            return Err<double>(ErrorCode::ParseError, "bad number in state: " + *field);
        }
        return value;
    }

    Result<int64_t> StateReader::nextInt() {
        auto field = nextField();
        if (!field) return field.error();

        try {
            size_t consumed = 0;
            long long value = std::stoll(*field, &consumed);
            if (consumed != field->size()) {
                return Err<int64_t>(ErrorCode::ParseError, "bad integer in state: " + *field);
            }
            return static_cast<int64_t>(value);
        } catch (const std::exception&) {
            return Err<int64_t>(ErrorCode::ParseError, "bad integer in state: " + *field);
        }
    }

    Result<bool> StateReader::nextBool() {
        auto field = nextField();
        if (!field) return field.error();

        if (*field == "1") return true;
        if (*field == "0") return false;
        return Err<bool>(ErrorCode::ParseError, "bad flag in state: " + *field);
    }

}
