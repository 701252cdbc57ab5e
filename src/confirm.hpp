#pragma once

#include "models.hpp"

#include <iosfwd>
#include <string>
#include <vector>

namespace product_sync {

/// Human confirmation seam used by the upload orchestrator.
class Confirmer {
public:
    virtual ~Confirmer() = default;

    /// Ask a yes/no question.
    virtual bool approve(const std::string& prompt) = 0;

    /// Let the operator pick which diffs to push.
    virtual std::vector<ConfirmedChange> selectDiffs(const std::vector<KindedDiff>& diffs) = 0;
};

/// Answers yes to everything and selects every diff (--yes).
class AutoConfirmer : public Confirmer {
public:
    bool approve(const std::string& prompt) override;
    std::vector<ConfirmedChange> selectDiffs(const std::vector<KindedDiff>& diffs) override;
};

/// Line-oriented terminal prompts.  End of input counts as "no".
class ConsoleConfirmer : public Confirmer {
public:
    ConsoleConfirmer(std::istream& in, std::ostream& out);

    bool approve(const std::string& prompt) override;

    /// Renders each diff as a Remote | Local table and asks [y/N/a/q]:
    /// a = accept this and every remaining diff, q = stop selecting.
    std::vector<ConfirmedChange> selectDiffs(const std::vector<KindedDiff>& diffs) override;

    /// Two-column rendering of one diff; changed rows are marked -/+.
    static std::string renderDiff(const KindedDiff& diff);

private:
    std::istream& mIn;
    std::ostream& mOut;

    std::string readAnswer();
};

} // namespace product_sync
