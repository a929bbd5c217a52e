/**
 * @file view.cpp
 * @brief Per-computation repository snapshot
 */

#include "verso/repository.hpp"

#include <algorithm>
#include <utility>

namespace verso::repository {

const Commit* RepositoryView::find_commit(const CommitId& sha) const
{
    auto it = std::ranges::find(history, sha, &Commit::sha);
    return it == history.end() ? nullptr : &*it;
}

verso::Result<RepositoryView> make_repository_view(const RepositoryInspector& inspector)
{
    auto branch = inspector.current_branch();
    if (!branch) {
        return std::unexpected(branch.error());
    }
    auto head_sha = inspector.current_commit();
    if (!head_sha) {
        return std::unexpected(head_sha.error());
    }
    auto history = inspector.commits_between(std::nullopt, *head_sha);
    if (!history) {
        return std::unexpected(history.error());
    }
    if (history->empty() || history->front().sha != *head_sha) {
        return std::unexpected(Error::make(std::string(error_code::kNoCommits),
                                           "History of " + *head_sha + " does not start at HEAD"));
    }
    auto tags = inspector.tags();
    if (!tags) {
        return std::unexpected(tags.error());
    }
    auto first = inspector.first_commit();
    if (!first) {
        return std::unexpected(first.error());
    }

    RepositoryView view;
    view.branch = std::move(*branch);
    view.head = history->front();
    view.history = std::move(*history);
    view.tags = std::move(*tags);
    view.first_commit = first->empty() ? view.head.sha : std::move(*first);
    return view;
}

}  // namespace verso::repository
