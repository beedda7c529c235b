#include "platform_info.hpp"

#include <QOffscreenSurface>
#include <QOpenGLContext>
#include <QOpenGLFunctions>
#include <QString>

PlatformInfo::PlatformInfo() { m_isNvidia = DetectNvidia(); }

bool PlatformInfo::DetectNvidia() const
{
    QOpenGLContext context;
    if (!context.create())
        return false;

    QOffscreenSurface surface;
    surface.setFormat(context.format());
    surface.create();

    if (!context.makeCurrent(&surface))
        return false;

    QOpenGLFunctions functions;
    functions.initializeOpenGLFunctions();

    const GLubyte* vendor = functions.glGetString(GL_VENDOR);
    if (vendor == nullptr)
        return false;

    const QString vendorString = QString::fromUtf8(reinterpret_cast<const char*>(vendor));
    context.doneCurrent();

    return vendorString.contains("NVIDIA", Qt::CaseInsensitive);
}
