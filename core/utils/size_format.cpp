#include "size_format.hpp"

QString formatSize(quint64 bytes)
{
    constexpr double KB = 1024.0;
    constexpr double MB = KB * 1024.0;
    constexpr double GB = MB * 1024.0;

    const auto size = static_cast<double>(bytes);

    if (size < KB)
        return QString("%1 B").arg(bytes);

    if (size < MB)
        return QString("%1 KB").arg(size / KB, 0, 'f', 1);

    if (size < GB)
        return QString("%1 MB").arg(size / MB, 0, 'f', 1);

    return QString("%1 GB").arg(size / GB, 0, 'f', 2);
}
