#include "confirm.hpp"
#include "diff.hpp"
#include "util.hpp"

#include <iomanip>
#include <istream>
#include <ostream>
#include <sstream>

namespace product_sync {

namespace {

constexpr std::size_t kColumnWidth = 40;

std::string clip(const std::string& s) {
    std::string oneLine = s;
    for (char& c : oneLine) {
        if (c == '\n' || c == '\r' || c == '\t') c = ' ';
    }
    if (oneLine.size() <= kColumnWidth) return oneLine;
    return oneLine.substr(0, kColumnWidth - 3) + "...";
}

} // namespace

// ---------------------------------------------------------------------------
// AutoConfirmer
// ---------------------------------------------------------------------------

bool AutoConfirmer::approve(const std::string& /*prompt*/) {
    return true;
}

std::vector<ConfirmedChange> AutoConfirmer::selectDiffs(const std::vector<KindedDiff>& diffs) {
    std::vector<ConfirmedChange> all;
    all.reserve(diffs.size());
    for (const auto& d : diffs) {
        all.push_back(ConfirmedChange{d.kind, d.diff.id});
    }
    return all;
}

// ---------------------------------------------------------------------------
// ConsoleConfirmer
// ---------------------------------------------------------------------------

ConsoleConfirmer::ConsoleConfirmer(std::istream& in, std::ostream& out)
    : mIn(in)
    , mOut(out) {}

std::string ConsoleConfirmer::readAnswer() {
    std::string line;
    if (!std::getline(mIn, line)) {
        return "";
    }
    return toLower(trim(line));
}

bool ConsoleConfirmer::approve(const std::string& prompt) {
    mOut << prompt << " [y/N] " << std::flush;
    const std::string answer = readAnswer();
    return answer == "y" || answer == "yes";
}

std::string ConsoleConfirmer::renderDiff(const KindedDiff& diff) {
    std::ostringstream out;
    out << kindName(diff.kind) << ": " << diff.diff.name
        << " (ID: " << diff.diff.id << ")\n";
    out << "  " << std::left << std::setw(kColumnWidth + 22) << "Remote Product"
        << "Product Changes\n";

    for (const auto& change : diff.diff.changes) {
        const std::string label = std::string(fieldName(change.field)) + ": ";
        const bool changed = change.change != ChangeKind::Unchanged;

        std::string left;
        if (change.change != ChangeKind::Created) {
            left = (changed ? "- " : "  ") + label +
                   clip(formatDiffValue(change.values, /*after=*/false));
        }
        const std::string right = (changed ? "+ " : "  ") + label +
                                  clip(formatDiffValue(change.values, /*after=*/true));

        out << "  " << std::left << std::setw(kColumnWidth + 22) << left << right << "\n";
    }
    return out.str();
}

std::vector<ConfirmedChange> ConsoleConfirmer::selectDiffs(const std::vector<KindedDiff>& diffs) {
    std::vector<ConfirmedChange> confirmed;

    mOut << diffs.size() << " product(s) differ from the universe.\n\n";

    for (std::size_t i = 0; i < diffs.size(); ++i) {
        const auto& d = diffs[i];
        mOut << renderDiff(d)
             << "Confirm " << kindName(d.kind) << " '" << d.diff.name
             << "'? [y/N/a/q] " << std::flush;

        const std::string answer = readAnswer();
        mOut << "\n";

        if (answer == "y" || answer == "yes") {
            confirmed.push_back(ConfirmedChange{d.kind, d.diff.id});
        } else if (answer == "a" || answer == "all") {
            for (std::size_t j = i; j < diffs.size(); ++j) {
                confirmed.push_back(ConfirmedChange{diffs[j].kind, diffs[j].diff.id});
            }
            break;
        } else if (answer == "q" || answer == "quit") {
            break;
        }
    }

    mOut << confirmed.size() << " of " << diffs.size() << " change(s) selected.\n";
    return confirmed;
}

} // namespace product_sync
