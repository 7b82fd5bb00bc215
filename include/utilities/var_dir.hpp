#pragma once

#include <string>

namespace chunkvault {

void setVarDir(const std::string &dir);
const std::string &getVarDir();

std::string logsDir();
std::string metadataSnapshotPath();

/// Default directory backing a locally hosted node called @p nodeName.
std::string nodeDataDir(const std::string &nodeName);

} // namespace chunkvault
