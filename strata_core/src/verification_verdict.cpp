#include "verification_verdict.h"

#include <sstream>

namespace strata {

static std::string nodes_phrase(std::size_t n) {
    return std::to_string(n) + (n == 1 ? " node" : " nodes");
}

bool VerificationVerdict::clean() const {
    return failures_.empty() && missing_count() == 0 && conflicts_.empty();
}

std::size_t VerificationVerdict::missing_count() const {
    return missing_groups_.size() + missing_partitions_.size() + missing_metadata_.size();
}

bool VerificationVerdict::is_missing_group(int32_t group_id) const {
    for (const auto& e : missing_groups_) {
        if (e.group_id == group_id) {
            return true;
        }
    }
    return false;
}

bool VerificationVerdict::is_missing_partition(const PartitionKey& key) const {
    for (const auto& e : missing_partitions_) {
        if (e.key == key) {
            return true;
        }
    }
    return false;
}

std::string VerificationVerdict::group_name(int32_t group_id) const {
    auto it = group_names_.find(group_id);
    if (it == group_names_.end()) {
        return std::to_string(group_id);
    }
    return it->second;
}

void VerificationVerdict::print(std::ostream& os, bool verbose) const {
    os << "Snapshot check for \"" << snapshot_ << "\" (epoch " << epoch_ << "), "
       << nodes_phrase(nodes_.size()) << " checked.\n";

    if (!failures_.empty()) {
        os << "The check procedure failed on " << nodes_phrase(failures_.size()) << ":\n";
        for (const auto& [node, failure] : failures_) {
            os << "  node " << node << " [" << strata::to_string(failure.kind()) << "]\n";
            for (std::size_t i = 0; i < failure.causes.size(); ++i) {
                os << (i == 0 ? "    " : "    caused by: ")
                   << failure.causes[i].message << "\n";
            }
        }
    }

    if (!missing_groups_.empty()) {
        os << "Snapshot data doesn't contain required cache groups [";
        bool first = true;
        for (const auto& e : missing_groups_) {
            os << (first ? "" : ", ") << "grpName=" << e.group_name
               << ", grpId=" << e.group_id << ", node=" << e.node_id;
            first = false;
        }
        os << "]\n";
    }

    if (!missing_partitions_.empty()) {
        os << "Snapshot data doesn't contain required cache group partition [";
        bool first = true;
        for (const auto& e : missing_partitions_) {
            os << (first ? "" : ", ") << "grpName=" << e.group_name
               << ", partId=" << e.key.partition << ", node=" << e.node_id;
            first = false;
        }
        os << "]\n";
    }

    if (!missing_metadata_.empty()) {
        os << "Some metadata is missing from the snapshot [";
        bool first = true;
        for (const auto& e : missing_metadata_) {
            os << (first ? "" : ", ") << "file=" << e.file << ", node=" << e.node_id;
            if (e.group_id) {
                os << ", grpName=" << group_name(*e.group_id);
            }
            first = false;
        }
        os << "]\n";
    }

    for (const auto& [key, counters] : conflicts_) {
        os << "Conflict partition: PartitionKey [grpId=" << key.group_id
           << ", grpName=" << group_name(key.group_id)
           << ", partId=" << key.partition << "]\n";
        os << "Partition instances: [";
        bool first = true;
        for (const auto& [node, counter] : counters) {
            os << (first ? "" : ", ") << node << ":updateCntr=" << counter;
            first = false;
        }
        os << "]\n";
    }

    if (verbose) {
        for (const auto& [key, records] : partitions_) {
            if (conflicts_.count(key) > 0) {
                continue;
            }
            os << "Partition " << key << " grpName=" << group_name(key.group_id) << ": [";
            bool first = true;
            for (const auto& [node, rec] : records) {
                os << (first ? "" : ", ") << node << ":updateCntr=" << rec.update_counter
                   << ", pages=" << rec.pages_checked;
                first = false;
            }
            os << "]\n";
        }
    }

    if (!failures_.empty()) {
        os << "The check procedure failed on " << nodes_phrase(failures_.size()) << ".\n";
    } else if (!clean()) {
        os << "The check procedure has finished, found " << conflicts_.size() << " conflict partitions";
        if (missing_count() > 0) {
            os << " and " << missing_count() << " missing snapshot entries";
        }
        os << ".\n";
    } else {
        os << "The check procedure has finished, no conflicts have been found.\n";
    }
}

std::string VerificationVerdict::to_string(bool verbose) const {
    std::ostringstream os;
    print(os, verbose);
    return os.str();
}

}  // namespace strata
