#include "Viewer/core.hpp"
#include "Viewer/ViewerInternal.hpp"

#include <algorithm>

namespace
{
    // 顶点着色器: pos2 + color4, already in NDC
    const char* kVertexShader = R"GLSL(
        #version 330 core
        layout(location = 0) in vec2 aPos;
        layout(location = 1) in vec4 aColor;
        out vec4 vColor;
        void main() {
            vColor = aColor;
            gl_Position = vec4(aPos, 0.0, 1.0);
        }
    )GLSL";

    const char* kFragmentShader = R"GLSL(
        #version 330 core
        in vec4 vColor;
        out vec4 FragColor;
        void main() {
            FragColor = vColor;
        }
    )GLSL";

    // Throws with the driver's info log when compilation fails.
    GLuint CompileStage(GLenum type, const char* src, const char* name)
    {
        GLuint shader = glCreateShader(type);
        glShaderSource(shader, 1, &src, nullptr);
        glCompileShader(shader);

        GLint ok = 0;
        glGetShaderiv(shader, GL_COMPILE_STATUS, &ok);
        if (ok) return shader;

        char log[1024] = {};
        glGetShaderInfoLog(shader, (GLsizei)sizeof(log), nullptr, log);
        glDeleteShader(shader);
        throw std::runtime_error(std::string(name) + " shader: " + log);
    }

    GLuint BuildProgram()
    {
        const GLuint vs = CompileStage(GL_VERTEX_SHADER, kVertexShader, "vertex");
        GLuint fs = 0;
        try {
            fs = CompileStage(GL_FRAGMENT_SHADER, kFragmentShader, "fragment");
        }
        catch (const std::runtime_error&) {
            glDeleteShader(vs);
            throw;
        }

        GLuint prog = glCreateProgram();
        glAttachShader(prog, vs);
        glAttachShader(prog, fs);
        glLinkProgram(prog);
        glDeleteShader(vs);
        glDeleteShader(fs);

        GLint ok = 0;
        glGetProgramiv(prog, GL_LINK_STATUS, &ok);
        if (ok) return prog;

        char log[1024] = {};
        glGetProgramInfoLog(prog, (GLsizei)sizeof(log), nullptr, log);
        glDeleteProgram(prog);
        throw std::runtime_error(std::string("program link: ") + log);
    }

    void OnFramebufferSize(GLFWwindow* w, int width, int height)
    {
        // glad may not be loaded yet, so only record the size
        if (auto* self = static_cast<Viewer*>(glfwGetWindowUserPointer(w)))
            self->onFramebufferResized(width, height);
    }
}

void Viewer::initWindowAndGL()
{
    if (!glfwInit())
        throw std::runtime_error("glfwInit failed");

    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
#if defined(__APPLE__)
    glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GLFW_TRUE);
#endif
    // the window is sized from the maze; cells stay square
    glfwWindowHint(GLFW_RESIZABLE, GLFW_FALSE);

    const int winW = std::max(64, maze.Width() * cfg.cellSize);
    const int winH = std::max(64, maze.Height() * cfg.cellSize);

    GLFWwindow* win = glfwCreateWindow(winW, winH, "Maze", nullptr, nullptr);
    if (!win)
    {
        glfwTerminate();
        throw std::runtime_error("glfwCreateWindow failed");
    }
    window = win;

    glfwMakeContextCurrent(win);
    glfwSwapInterval(1);
    glfwSetWindowUserPointer(win, this);
    glfwSetFramebufferSizeCallback(win, OnFramebufferSize);

    // HiDPI: framebuffer pixels can differ from window units
    int w = winW, h = winH;
    glfwGetFramebufferSize(win, &w, &h);
    onFramebufferResized(w, h);

    if (!gladLoadGLLoader((GLADloadproc)glfwGetProcAddress))
    {
        glfwDestroyWindow(win);
        window = nullptr;
        glfwTerminate();
        throw std::runtime_error("gladLoadGLLoader failed");
    }

    program = BuildProgram();

    glGenVertexArrays(1, &vao);
    glGenBuffers(1, &vbo);
    glBindVertexArray(vao);
    glBindBuffer(GL_ARRAY_BUFFER, vbo);

    const GLsizei stride = (GLsizei)sizeof(Vertex);
    glEnableVertexAttribArray(0);
    glVertexAttribPointer(0, 2, GL_FLOAT, GL_FALSE, stride, (void*)offsetof(Vertex, x));
    glEnableVertexAttribArray(1);
    glVertexAttribPointer(1, 4, GL_FLOAT, GL_FALSE, stride, (void*)offsetof(Vertex, r));

    glBindVertexArray(0);
    glBindBuffer(GL_ARRAY_BUFFER, 0);

    // faded explored cells use alpha
    glEnable(GL_BLEND);
    glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);

    initInputCallbacks();
    updateWindowTitle();
}

void Viewer::shutdownGL()
{
    if (!window) return;

    if (vbo) glDeleteBuffers(1, &vbo);
    if (vao) glDeleteVertexArrays(1, &vao);
    if (program) glDeleteProgram(program);
    vbo = vao = program = 0;
    vertexCount = 0;

    glfwDestroyWindow(static_cast<GLFWwindow*>(window));
    window = nullptr;
    glfwTerminate();
}
