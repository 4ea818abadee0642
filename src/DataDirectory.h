#ifndef DIRECTORY_NAME_PROVIDER_H
#define DIRECTORY_NAME_PROVIDER_H

#include <boost/filesystem/path.hpp>

boost::filesystem::path GetDefaultDataDir();
/** -datadir if given, the platform default otherwise. Created on first use. */
const boost::filesystem::path& GetDataDir();
void ClearDatadirCache();

bool TryCreateDirectory(const boost::filesystem::path& p);

#endif
