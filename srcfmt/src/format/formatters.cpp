//! # Built-in Formatters
//!
//! Static descriptor table for the fixed set of formatter variants and the
//! `EngineFormatter` that serves all of them.

#include "format/formatter.hpp"

#include "log/log.hpp"

#include <algorithm>
#include <array>

namespace srcfmt::format {

namespace {

struct FormatterInfo {
    FormatterKind kind;
    std::string_view name;
    std::string_view description;
    Language language;
    std::string_view default_style;
    std::string_view assume_filename;
    std::array<std::string_view, 8> extensions;
};

constexpr std::array<FormatterInfo, 2> FORMATTERS = {{
    {FormatterKind::Java,
     "java",
     "Java source formatter",
     Language::Java,
     "Google",
     "Source.java",
     {".java"}},
    {FormatterKind::Cpp,
     "cpp",
     "C/C++ source formatter",
     Language::Cpp,
     "LLVM",
     "source.cpp",
     {".c", ".cc", ".cpp", ".cxx", ".h", ".hh", ".hpp", ".hxx"}},
}};

const FormatterInfo& info_for(FormatterKind kind) {
    for (const auto& info : FORMATTERS) {
        if (info.kind == kind) {
            return info;
        }
    }
    return FORMATTERS[0];
}

} // namespace

// ============================================================================
// EngineFormatter
// ============================================================================

EngineFormatter::EngineFormatter(FormatterKind kind, Rc<const FormattingEngine> engine)
    : kind_(kind), engine_(std::move(engine)) {}

std::string_view EngineFormatter::name() const {
    return info_for(kind_).name;
}

std::string_view EngineFormatter::short_description() const {
    return info_for(kind_).description;
}

bool EngineFormatter::is_applicable(const fs::path& path) const {
    const auto& exts = info_for(kind_).extensions;
    std::string ext = path.extension().string();
    if (ext.empty()) {
        return false;
    }
    return std::find(exts.begin(), exts.end(), ext) != exts.end();
}

Result<std::string, FormatError>
EngineFormatter::format(std::string_view text, const config::FormatterConfiguration& config) const {
    const auto& info = info_for(kind_);

    EngineRequest request;
    request.language = info.language;
    request.assume_filename = std::string(info.assume_filename);
    request.profile = config.profile;
    request.source_level = config.source_level;
    request.default_style = std::string(info.default_style);

    auto result = engine_->reformat(text, request);
    if (is_err(result)) {
        return FormatError{std::string(info.name), unwrap_err(result).message};
    }
    return std::move(unwrap(result));
}

// ============================================================================
// Registry
// ============================================================================

Rc<const FormatterCapability> make_formatter(FormatterKind kind, Rc<const FormattingEngine> engine) {
    return make_rc<const EngineFormatter>(kind, std::move(engine));
}

FormatterList default_formatters(const Rc<const FormattingEngine>& java_engine,
                                 const Rc<const FormattingEngine>& cpp_engine) {
    FormatterList list;
    for (const auto& info : FORMATTERS) {
        list.push_back(
            make_formatter(info.kind, info.kind == FormatterKind::Java ? java_engine : cpp_engine));
    }
    return list;
}

FormatterList default_formatters(const Rc<const FormattingEngine>& engine) {
    return default_formatters(engine, engine);
}

std::vector<const FormatterCapability*> applicable_formatters(const FormatterList& all,
                                                              const fs::path& path) {
    std::vector<const FormatterCapability*> result;
    for (const auto& formatter : all) {
        if (formatter->is_applicable(path)) {
            result.push_back(formatter.get());
        }
    }
    SRCFMT_LOG_TRACE("walk", path << ": " << result.size() << " applicable formatter(s)");
    return result;
}

} // namespace srcfmt::format
