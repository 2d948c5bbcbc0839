#pragma once

#include <cstdio>

#include <GL/gl3w.h>

#define GLDEBUG() \
{ \
    GLenum e; \
    while((e = glGetError()) != GL_NO_ERROR) \
    { \
        std::fprintf(stderr, "%s:%s:%d\n", getGLError(e), __FILE__, __LINE__); \
    } \
}

const char *getGLError(GLenum error);
