#ifndef PLATFORM_INFO_HPP
#define PLATFORM_INFO_HPP

class PlatformInfo
{
public:
    PlatformInfo();

    //! Whether the OpenGL vendor is NVIDIA, which the NVENC encoder needs.
    bool isNvidia() const { return m_isNvidia; };

private:
    bool DetectNvidia() const;

    bool m_isNvidia;
};

#endif
