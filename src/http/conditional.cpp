#include "gatefile/http/conditional.hpp"

#include "gatefile/http/etag.hpp"

namespace gatefile {

ConditionalContext ConditionalContext::from_metadata(const Metadata& md) {
    ConditionalContext ctx;
    ctx.range = std::string(md.pick(header::range));
    ctx.if_range = std::string(md.pick(header::if_range));
    ctx.if_match = std::string(md.pick(header::if_match));
    ctx.if_none_match = std::string(md.pick(header::if_none_match));
    ctx.if_unmodified_since = std::string(md.pick(header::if_unmodified_since));
    ctx.if_modified_since = std::string(md.pick(header::if_modified_since));
    return ctx;
}

namespace conditional {

namespace {

std::string_view trim_left(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) {
        s.remove_prefix(1);
    }
    return s;
}

// Walks a comma separated entity tag list up to the first malformed entry.
// True when the list holds "*" or `matches` accepts one of its tags.
template<typename F>
bool any_tag(std::string_view list, F matches) {
    for (;;) {
        list = trim_left(list);
        while (!list.empty() && (list.back() == ' ' || list.back() == '\t')) {
            list.remove_suffix(1);
        }
        if (list.empty()) {
            return false;
        }
        if (list.front() == ',') {
            list.remove_prefix(1);
            continue;
        }
        if (list.front() == '*') {
            return true;
        }
        auto scanned = etag::scan(list);
        if (scanned.tag.empty()) {
            return false;
        }
        if (matches(scanned.tag)) {
            return true;
        }
        list = scanned.remain;
    }
}

void write_not_modified(ResponseHeaders& outgoing) {
    outgoing.erase(header::content_type);
    outgoing.erase(header::content_length);
    outgoing.erase(header::content_encoding);
    if (!outgoing.get(header::etag).empty()) {
        outgoing.erase(header::last_modified);
    }
    outgoing.set_status(304);
}

} // anonymous namespace

CondResult check_if_match(const ConditionalContext& ctx, std::string_view resource_etag) {
    if (ctx.if_match.empty()) {
        return CondResult::None;
    }
    bool matched = any_tag(ctx.if_match, [&](std::string_view tag) {
        return etag::strong_match(tag, resource_etag);
    });
    return matched ? CondResult::True : CondResult::False;
}

CondResult check_if_unmodified_since(const ConditionalContext& ctx, http_date::TimePoint mod_time) {
    if (ctx.if_unmodified_since.empty() || http_date::is_unspecified(mod_time)) {
        return CondResult::None;
    }
    auto t = http_date::parse(ctx.if_unmodified_since);
    if (!t) {
        return CondResult::None;
    }
    // Last-Modified carries whole seconds only
    return http_date::truncate_to_seconds(mod_time) <= *t ? CondResult::True : CondResult::False;
}

CondResult check_if_none_match(const ConditionalContext& ctx, std::string_view resource_etag) {
    if (ctx.if_none_match.empty()) {
        return CondResult::None;
    }
    bool matched = any_tag(ctx.if_none_match, [&](std::string_view tag) {
        return etag::weak_match(tag, resource_etag);
    });
    return matched ? CondResult::False : CondResult::True;
}

CondResult check_if_modified_since(const ConditionalContext& ctx, http_date::TimePoint mod_time) {
    if (ctx.if_modified_since.empty() || http_date::is_unspecified(mod_time)) {
        return CondResult::None;
    }
    auto t = http_date::parse(ctx.if_modified_since);
    if (!t) {
        return CondResult::None;
    }
    return http_date::truncate_to_seconds(mod_time) <= *t ? CondResult::False : CondResult::True;
}

CondResult check_if_range(const ConditionalContext& ctx, std::string_view resource_etag,
                          http_date::TimePoint mod_time) {
    if (ctx.if_range.empty()) {
        return CondResult::None;
    }
    auto scanned = etag::scan(ctx.if_range);
    if (!scanned.tag.empty()) {
        return etag::strong_match(scanned.tag, resource_etag) ? CondResult::True : CondResult::False;
    }
    // Otherwise the validator is a date, compared at second resolution
    if (mod_time == http_date::TimePoint{}) {
        return CondResult::False;
    }
    auto t = http_date::parse(ctx.if_range);
    if (!t) {
        return CondResult::False;
    }
    return http_date::truncate_to_seconds(mod_time) == *t ? CondResult::True : CondResult::False;
}

Preconditions evaluate(const ConditionalContext& ctx,
                       ResponseHeaders& outgoing,
                       http_date::TimePoint mod_time) {
    Preconditions result;
    std::string resource_etag(outgoing.get(header::etag));

    auto ch = check_if_match(ctx, resource_etag);
    if (ch == CondResult::None) {
        ch = check_if_unmodified_since(ctx, mod_time);
    }
    if (ch == CondResult::False) {
        outgoing.set_status(412);
        result.outcome = Outcome::PreconditionFailed;
        return result;
    }

    switch (check_if_none_match(ctx, resource_etag)) {
        case CondResult::False:
            write_not_modified(outgoing);
            result.outcome = Outcome::NotModified;
            return result;
        case CondResult::None:
            if (check_if_modified_since(ctx, mod_time) == CondResult::False) {
                write_not_modified(outgoing);
                result.outcome = Outcome::NotModified;
                return result;
            }
            break;
        case CondResult::True:
            break;
    }

    result.range = ctx.range;
    if (!result.range.empty() && check_if_range(ctx, resource_etag, mod_time) == CondResult::False) {
        result.range.clear();
    }
    return result;
}

} // namespace conditional

} // namespace gatefile
