#include <cstdint>
#include <cstdio>

#include <GL/gl3w.h>

#include "OpenGLDebug.hpp"
#include "Texture.hpp"

static GLenum orderToGLFormat(const std::string& order)
{
    if (order == "BGRA")
        return GL_BGRA;
    if (order == "BGR")
        return GL_BGR;
    if (order == "RGB")
        return GL_RGB;
    return GL_RGBA;
}

Texture::~Texture()
{
    if (id) {
        glDeleteTextures(1, &id);
        GLDEBUG();
    }
}

void Texture::create(size_t w, size_t h)
{
    if (id) {
        glDeleteTextures(1, &id);
        GLDEBUG();
    }
    glGenTextures(1, &id);
    GLDEBUG();

    glBindTexture(GL_TEXTURE_2D, id);
    GLDEBUG();
    glTexImage2D(GL_TEXTURE_2D, 0, GL_RGBA8, w, h, 0, GL_RGBA, GL_UNSIGNED_BYTE, nullptr);
    GLDEBUG();

    // the framebuffer is already at screen resolution
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_NEAREST);
    GLDEBUG();
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_NEAREST);
    GLDEBUG();
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
    GLDEBUG();
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
    GLDEBUG();

    glBindTexture(GL_TEXTURE_2D, 0);
    GLDEBUG();

    this->w = w;
    this->h = h;
}

void Texture::upload(const RGBArray& array, const std::string& order)
{
    if (array.empty())
        return;
    if (order.size() != array.c || (array.c != 3 && array.c != 4)) {
        fprintf(stderr, "cannot upload a framebuffer with order '%s'\n", order.c_str());
        return;
    }

    if (!id || w != array.w || h != array.h) {
        create(array.w, array.h);
    }

    glBindTexture(GL_TEXTURE_2D, id);
    GLDEBUG();
    glPixelStorei(GL_UNPACK_ALIGNMENT, 1);
    GLDEBUG();
    glTexSubImage2D(GL_TEXTURE_2D, 0, 0, 0, array.w, array.h,
                    orderToGLFormat(order), GL_UNSIGNED_BYTE, array.data.data());
    GLDEBUG();
    glBindTexture(GL_TEXTURE_2D, 0);
    GLDEBUG();
}
