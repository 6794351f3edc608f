#include "utils.hpp"

#include "charset/charset.hpp"
#include "common.hpp"

namespace srcfmt::cli {

void print_usage(std::ostream& out, const format::FormatterList& formatters) {
    out << "srcfmt " << VERSION << "\n\n";
    out << "Usage: srcfmt [options] <file-or-directory>\n\n";
    out << "Options:\n";
    out << "  -c, --conf <url>        Formatter profile (path or file:// URL)\n";
    out << "  -l, --level <version>   Source level passed to the formatters\n";
    out << "  -H, --header <file>     Header block kept at the top of each file\n";
    out << "  -e, --encoding <name>   File charset (default " << charset::DEFAULT_CHARSET << ")\n";
    out << "  -s, --linesep <sep>     Line separator: lf, cr or crlf (default lf)\n";
    out << "  -j, --jobs <n>          Worker threads, 0 for one per core (default 1)\n";
    out << "      --check             Report files that would change, write nothing\n";
    out << "  -h, --help              Show this help\n";
    out << "  -V, --version           Show version\n";
    out << "\nLogging:\n";
    out << "  -v, -vv                 Debug / trace output\n";
    out << "  -q, --quiet             Errors only\n";
    out << "  --log-level=<level>     trace, debug, info, warn, error, off\n";
    out << "  --log-filter=<spec>     Per-module levels, e.g. walk=trace,*=warn\n";
    out << "  --log-file=<path>       Also write log records to a file\n";
    out << "  --log-format=<fmt>      text or json\n";
    out << "\nWithout --conf, $HOME/formatter-profile.yml is used when it exists.\n";
    out << "\nAvailable source formatters : \n";
    for (const auto& formatter : formatters) {
        out << "\t* " << formatter->name() << " (" << formatter->short_description() << ")\n";
    }
}

void print_version(std::ostream& out) {
    out << "srcfmt " << VERSION << "\n";
}

void print_summary(std::ostream& out, const traversal::RunSummary& summary) {
    out << summary.visited << " file(s) visited: ";
    if (summary.check_only) {
        out << summary.changed << " would be reformatted, ";
    } else {
        out << summary.changed << " formatted, ";
    }
    out << summary.unchanged << " unchanged, " << summary.skipped << " skipped, " << summary.failed
        << " failed";
    if (summary.cancelled) {
        out << " (interrupted)";
    }
    out << "\n";
}

} // namespace srcfmt::cli
