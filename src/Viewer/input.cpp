#include "Viewer/core.hpp"
#include "Viewer/ViewerInternal.hpp"

void Viewer::initInputCallbacks()
{
    GLFWwindow *win = static_cast<GLFWwindow *>(window);
    glfwSetWindowUserPointer(win, this);

    glfwSetKeyCallback(win, [](GLFWwindow *w, int key, int /*scancode*/, int action, int /*mods*/)
    {
        auto* self = static_cast<Viewer*>(glfwGetWindowUserPointer(w));
        if (!self) return;
        if (action != GLFW_PRESS) return;

        switch (key)
        {
        case GLFW_KEY_Q:
        case GLFW_KEY_ESCAPE:
            glfwSetWindowShouldClose(w, GLFW_TRUE);
            break;

        case GLFW_KEY_R:
            // loaded mazes are replaced by a generated one of the configured size
            self->regenerate(self->seedRng());
            break;

        case GLFW_KEY_L:
            self->live = !self->live;
            self->stepBudget = 0.0;
            if (!self->live)
                self->runSteps(UINT32_MAX);
            self->updateWindowTitle();
            break;

        case GLFW_KEY_1: self->restartSolver(PathAlgo::DFS);   break;
        case GLFW_KEY_2: self->restartSolver(PathAlgo::BFS);   break;
        case GLFW_KEY_3: self->restartSolver(PathAlgo::AStar); break;

        case GLFW_KEY_S:
            self->saveMaze();
            break;

        default:
            break;
        }
    });
}
