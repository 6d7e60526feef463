#include "rid/core/errors.hpp"

#include "rid/core/resource_id.hpp"

namespace rid::core {

const char* status_code_name(StatusCode code) noexcept {
    switch (code) {
        case StatusCode::Ok: return "Ok";
        case StatusCode::Unknown: return "Unknown";
        case StatusCode::Invalid: return "Invalid";
        case StatusCode::InvalidLength: return "InvalidLength";
        case StatusCode::InvalidChar: return "InvalidChar";
        case StatusCode::InvalidResourceType: return "InvalidResourceType";
        case StatusCode::UnableToDecodeUlid: return "UnableToDecodeUlid";
        case StatusCode::NotFound: return "NotFound";
        case StatusCode::Corrupt: return "Corrupt";
        case StatusCode::Io: return "Io";
        case StatusCode::Unsupported: return "Unsupported";
        case StatusCode::Unavailable: return "Unavailable";
    }
    return "Unknown";
}

const char* status_domain_name(StatusDomain domain) noexcept {
    switch (domain) {
        case StatusDomain::Core: return "Core";
        case StatusDomain::Ulid: return "Ulid";
        case StatusDomain::ResourceId: return "ResourceId";
        case StatusDomain::Db: return "Db";
        case StatusDomain::External: return "External";
    }
    return "Unknown";
}

namespace {
    std::string describe_generic(Status s) {
        std::string msg = status_domain_name(s.domain);
        msg += ": ";
        msg += status_code_name(s.code);
        return msg;
    }

    std::string describe_ulid(Status s) {
        switch (s.code) {
            case StatusCode::InvalidLength: return "invalid length";
            case StatusCode::InvalidChar: return "invalid character";
            default: return describe_generic(s);
        }
    }
} // namespace

std::string status_describe(Status s, std::string_view subject) {
    if (is_ok(s)) {
        return "ok";
    }

    switch (s.domain) {
        case StatusDomain::Ulid:
            return describe_ulid(s);

        case StatusDomain::ResourceId:
            switch (s.code) {
                case StatusCode::InvalidResourceType: {
                    std::string msg = "Invalid resource type: ";
                    msg += subject;
                    return msg;
                }
                case StatusCode::InvalidLength: {
                    std::string msg = "Invalid ID length: ";
                    msg += subject;
                    msg += " (expected ";
                    msg += std::to_string(kResourceIdTextLen);
                    msg += ")";
                    return msg;
                }
                case StatusCode::UnableToDecodeUlid:
                    return "Unable to decode internal Ulid: " + describe_ulid(status_cause(s));
                default:
                    return describe_generic(s);
            }

        case StatusDomain::Db:
            if (s.code == StatusCode::Corrupt && s.aux != 0) {
                return "column decode failed: " + status_describe(status_cause(s), subject);
            }
            if (s.code == StatusCode::NotFound) {
                return "column decode failed: unexpected NULL";
            }
            if (s.code == StatusCode::Unsupported) {
                return "column decode failed: declared type is not VARCHAR";
            }
            return describe_generic(s);

        default:
            return describe_generic(s);
    }
}

} // namespace rid::core
