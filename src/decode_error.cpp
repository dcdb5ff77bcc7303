#include "sieve/decode_error.hpp"
#include "sieve/json.hpp"

#include <memory>

namespace Sieve {

    namespace {

        DecodeError make(DecodeError::code c, std::string_view desc, const value& v) {
            DecodeError e;
            e.errc = c;
            e.expected.assign(desc.begin(), desc.end());
            e.actual = std::make_shared<const value>(v);
            return e;
        }

        std::string generic_message(const DecodeError& e, bool newline) {
            auto printed = try_dump(*e.actual, { .pretty = true, .indent = SIEVE_ERROR_DUMP_INDENT, .max_depth = SIEVE_DEFAULT_MAX_DEPTH });
            if (!printed) {
                return "Expecting " + e.expected
                    + " but decoder failed. Couldn't report given value due to circular structure.";
            }
            return "Expecting " + e.expected + " but instead got:" + (newline ? "\n" : " ") + *printed;
        }

    } // namespace

    DecodeError DecodeError::bad_primitive(std::string_view desc, const value& v) {
        return make(code::bad_primitive, desc, v);
    }

    DecodeError DecodeError::bad_primitive_extra(std::string_view desc, const value& v, std::string_view reason) {
        auto e = make(code::bad_primitive_extra, desc, v);
        e.detail.assign(reason.begin(), reason.end());
        return e;
    }

    DecodeError DecodeError::bad_type(std::string_view desc, const value& v) {
        return make(code::bad_type, desc, v);
    }

    DecodeError DecodeError::bad_field(std::string_view desc, const value& v) {
        return make(code::bad_field, desc, v);
    }

    DecodeError DecodeError::bad_path(std::string_view desc, const value& v, std::string_view missing_segment) {
        auto e = make(code::bad_path, desc, v);
        e.detail.assign(missing_segment.begin(), missing_segment.end());
        return e;
    }

    DecodeError DecodeError::too_small_array(std::string_view desc, const value& v) {
        return make(code::too_small_array, desc, v);
    }

    DecodeError DecodeError::fail_message(std::string_view text) {
        DecodeError e;
        e.errc = code::fail_message;
        e.detail.assign(text.begin(), text.end());
        return e;
    }

    DecodeError DecodeError::bad_one_of(std::vector<std::string> rendered) {
        DecodeError e;
        e.errc = code::bad_one_of;
        e.messages = std::move(rendered);
        return e;
    }

    DecodeError DecodeError::direct(std::string_view text) {
        DecodeError e;
        e.errc = code::direct;
        e.detail.assign(text.begin(), text.end());
        return e;
    }

    std::string DecodeError::message() const {
        switch (errc) {
        case code::bad_primitive:
            return generic_message(*this, false);
        case code::bad_type:
        case code::bad_field:
            return generic_message(*this, true);
        case code::bad_primitive_extra:
            return generic_message(*this, false) + "\nReason: " + detail;
        case code::bad_path:
            return generic_message(*this, true) + "\nNode `" + detail + "` is unknown.";
        case code::too_small_array: {
            auto printed = try_dump(*actual, { .pretty = true, .indent = SIEVE_ERROR_DUMP_INDENT, .max_depth = SIEVE_DEFAULT_MAX_DEPTH });
            if (!printed) return generic_message(*this, true);
            return "Expecting " + expected + ".\n" + *printed;
        }
        case code::bad_one_of: {
            std::string out = "I run into the following problems:\n\n";
            for (size_t i = 0; i < messages.size(); i++) {
                if (i != 0) out += '\n';
                out += messages[i];
            }
            return out;
        }
        case code::fail_message:
            return "I run into a `fail` decoder.\n" + detail;
        case code::direct:
            return detail;
        }
        return detail;
    }

    std::string to_string(const DecodeError& err) {
        return err.message();
    }

    std::string_view to_string(DecodeError::code c) noexcept {
        switch (c) {
        case DecodeError::code::bad_primitive: return "bad_primitive";
        case DecodeError::code::bad_primitive_extra: return "bad_primitive_extra";
        case DecodeError::code::bad_type: return "bad_type";
        case DecodeError::code::bad_field: return "bad_field";
        case DecodeError::code::bad_path: return "bad_path";
        case DecodeError::code::too_small_array: return "too_small_array";
        case DecodeError::code::fail_message: return "fail_message";
        case DecodeError::code::bad_one_of: return "bad_one_of";
        case DecodeError::code::direct: return "direct";
        }
        return "unknown";
    }

    DecodeException::DecodeException(DecodeError err)
        : std::runtime_error{ err.message() }, m_Error{ std::move(err) } {}

} // namespace Sieve
