#pragma once

#include <map>
#include <string>

#include "affinity.h"
#include "snapshot_types.h"
#include "verification_verdict.h"

namespace strata {

/*
    ResultAggregator

    Merges per-node outcomes of one check into a VerificationVerdict.
    Failed nodes only contribute their failure. Findings are the union
    over the surviving nodes. Update counters are compared per partition
    among the surviving nodes the assignment expects to own it.
*/
class ResultAggregator {
public:
    ResultAggregator(const SnapshotDescriptor& desc, const PartitionAssignment& assignment);

    VerificationVerdict aggregate(const std::map<std::string, NodeVerificationOutcome>& outcomes) const;

private:
    const SnapshotDescriptor& desc_;
    const PartitionAssignment& assignment_;
};

}  // namespace strata
