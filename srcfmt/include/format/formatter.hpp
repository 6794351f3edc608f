//! # Formatter Capability
//!
//! Every formatter exposes the same four operations; the traversal and the
//! pipeline never dispatch on the concrete variant.
//!
//! ## Variants
//!
//! The set of formatters is fixed at compile time:
//!
//! | Kind   | Name   | Applies to                              | Engine language |
//! |--------|--------|-----------------------------------------|-----------------|
//! | `Java` | `java` | `.java`                                 | `Language::Java`|
//! | `Cpp`  | `cpp`  | `.c .cc .cpp .cxx .h .hh .hpp .hxx`     | `Language::Cpp` |
//!
//! `default_formatters()` registers them in that order, which is also the
//! order the pipeline applies them in.

#ifndef SRCFMT_FORMAT_FORMATTER_HPP
#define SRCFMT_FORMAT_FORMATTER_HPP

#include "common.hpp"
#include "config/config.hpp"
#include "format/engine.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

namespace srcfmt::format {

/// Interface implemented by every formatter.
///
/// Implementations are immutable after construction and may be called
/// concurrently from several worker threads.
class FormatterCapability {
public:
    virtual ~FormatterCapability() = default;

    virtual std::string_view name() const = 0;
    virtual std::string_view short_description() const = 0;

    /// Whether this formatter handles `path` (typically by extension).
    virtual bool is_applicable(const fs::path& path) const = 0;

    /// Formats UTF-8 `text`. Fails when the content cannot be processed.
    virtual Result<std::string, FormatError>
    format(std::string_view text, const config::FormatterConfiguration& config) const = 0;
};

/// Ordered, immutable set of registered formatters.
using FormatterList = std::vector<Rc<const FormatterCapability>>;

// ============================================================================
// Built-in Variants
// ============================================================================

enum class FormatterKind { Java, Cpp };

/// Formatter that hands the text to a `FormattingEngine`.
class EngineFormatter : public FormatterCapability {
public:
    EngineFormatter(FormatterKind kind, Rc<const FormattingEngine> engine);

    std::string_view name() const override;
    std::string_view short_description() const override;
    bool is_applicable(const fs::path& path) const override;
    Result<std::string, FormatError>
    format(std::string_view text, const config::FormatterConfiguration& config) const override;

    FormatterKind kind() const {
        return kind_;
    }

private:
    FormatterKind kind_;
    Rc<const FormattingEngine> engine_;
};

Rc<const FormatterCapability> make_formatter(FormatterKind kind, Rc<const FormattingEngine> engine);

/// All built-in formatters in registration order, Java backed by
/// `java_engine` and C/C++ by `cpp_engine`.
FormatterList default_formatters(const Rc<const FormattingEngine>& java_engine,
                                 const Rc<const FormattingEngine>& cpp_engine);

/// All built-in formatters sharing one engine.
FormatterList default_formatters(const Rc<const FormattingEngine>& engine);

/// Formatters from `all` applicable to `path`, keeping registration order.
std::vector<const FormatterCapability*> applicable_formatters(const FormatterList& all,
                                                              const fs::path& path);

} // namespace srcfmt::format

#endif // SRCFMT_FORMAT_FORMATTER_HPP
