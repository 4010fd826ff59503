#pragma once

#include "DestinationIndex.h"
#include "ExtensionClassifier.h"
#include "MediaTypes.h"

namespace TransferPlanner {

TransferPlan plan(const SelectionResult &selection,
                  const DestinationIndex &index,
                  const ExtensionClassifier &classifier,
                  const LogCallback &log = LogCallback());
void sortOldestFirst(QVector<MediaFile> &files);

} // namespace TransferPlanner
