#ifndef SIZE_FORMAT_HPP
#define SIZE_FORMAT_HPP

#include <QString>

//! Human-readable size using binary multiples, e.g. "12.3 MB".
QString formatSize(quint64 bytes);

#endif
