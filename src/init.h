#ifndef KASWALLET_INIT_H
#define KASWALLET_INIT_H

/** Parses the command line, loads kaswallet.conf from the data directory and
 *  applies the logging switches. Returns false if the data directory given
 *  with -datadir does not exist. */
bool InitializeSettings(int argc, const char* const argv[]);

#endif // KASWALLET_INIT_H
