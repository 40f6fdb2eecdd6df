#include "Viewer/core.hpp"
#include "Viewer/ViewerInternal.hpp"

#include <algorithm>
#include <array>

namespace
{
    const Color kCell      {1.00f, 1.00f, 1.00f, 1.0f};
    const Color kEmptyCell {0.25f, 0.25f, 0.25f, 1.0f};
    const Color kWalk      {0.95f, 0.20f, 0.20f, 1.0f};
    const Color kTarget    {0.20f, 0.85f, 0.25f, 1.0f};
    const Color kPath      {0.95f, 0.20f, 0.20f, 1.0f};
    const Color kFrontier  {0.20f, 0.55f, 1.00f, 1.0f};

    Color Explored(bool finished, bool onPath)
    {
        // settled cells fade once the path is known
        const float a = (!finished || onPath) ? 1.0f : 0.25f;
        return {0.20f, 0.85f, 0.25f, a};
    }
}

void Viewer::rebuildMesh()
{
    meshDirty = false;

    const int cols = maze.Width();
    const int rows = maze.Height();
    if (cols <= 0 || rows <= 0) { vertexCount = 0; return; }

    std::vector<Vertex> verts;
    verts.reserve((size_t)rows * (size_t)cols * 6 * 4);

    const float cw = 2.0f / (float)cols;
    const float ch = 2.0f / (float)rows;

    // one pixel of wall on each side of a cell
    const float wallX = 2.0f / (float)std::max(1, fbW);
    const float wallY = 2.0f / (float)std::max(1, fbH);

    auto cellRect = [&](int c, int r, float x0, float y0, float x1, float y1) {
        // cell-local [0,1] coordinates, y down
        return std::array<float, 4>{
            -1.0f + ((float)c + x0) * cw,
             1.0f - ((float)r + y1) * ch,
            -1.0f + ((float)c + x1) * cw,
             1.0f - ((float)r + y0) * ch,
        };
    };

    auto pushCell = [&](const Point& p, float shrink, const Color& col) {
        const float pad = (1.0f - shrink) * 0.5f;
        const auto q = cellRect(p.x, p.y, pad, pad, 1.0f - pad, 1.0f - pad);
        PushRect(verts, q[0], q[1], q[2], q[3], col);
    };

    for (int r = 0; r < rows; ++r)
    {
        for (int c = 0; c < cols; ++c)
        {
            const uint8_t v = maze.Get(c, r);

            const float x0 = -1.0f + (float)c * cw;
            const float y1 =  1.0f - (float)r * ch;
            const float x1 = x0 + cw;
            const float y0 = y1 - ch;

            const float ix0 = x0 + wallX, ix1 = x1 - wallX;
            const float iy0 = y0 + wallY, iy1 = y1 - wallY;

            if (v == 0)
            {
                PushRect(verts, ix0, iy0, ix1, iy1, kEmptyCell);
                continue;
            }

            PushRect(verts, ix0, iy0, ix1, iy1, kCell);

            // open sides reach the cell edge so neighbouring cells join up
            if (v & Bit(Direction::Up))    PushRect(verts, ix0, iy1, ix1, y1, kCell);
            if (v & Bit(Direction::Down))  PushRect(verts, ix0, y0, ix1, iy0, kCell);
            if (v & Bit(Direction::Left))  PushRect(verts, x0, iy0, ix0, iy1, kCell);
            if (v & Bit(Direction::Right)) PushRect(verts, ix1, iy0, x1, iy1, kCell);
        }
    }

    if (!generated && generator)
    {
        for (const Point& p : generator->Trail())
            pushCell(p, 0.5f, kWalk);

        if (auto target = generator->Target())
            pushCell(*target, 0.7f, kTarget);
    }
    else if (solver)
    {
        const bool finished = solver->State() == ExploreState::Found;
        const auto& path = solver->Path();

        std::vector<uint8_t> onPath(maze.CellCount(), 0);
        if (finished)
            for (const Point& p : path) onPath[maze.IndexOf(p)] = 1;

        for (const Point& p : solver->Explored())
            pushCell(p, 0.5f, Explored(finished, onPath[maze.IndexOf(p)] != 0));

        if (!finished)
            for (const Point& p : solver->Frontier())
                pushCell(p, 0.5f, kFrontier);

        // DFS route (live) or final path
        if (finished || solver->Algo() == PathAlgo::DFS)
            for (const Point& p : path)
                pushCell(p, 0.3f, kPath);
    }

    glBindBuffer(GL_ARRAY_BUFFER, vbo);
    glBufferData(GL_ARRAY_BUFFER, (GLsizeiptr)(verts.size() * sizeof(Vertex)), verts.data(), GL_DYNAMIC_DRAW);
    glBindBuffer(GL_ARRAY_BUFFER, 0);

    vertexCount = (int)verts.size();
}

void Viewer::drawMaze()
{
    if (meshDirty)
        rebuildMesh();

    if (vertexCount <= 0) return;

    glViewport(0, 0, fbW, fbH);

    glUseProgram(program);
    glBindVertexArray(vao);
    glDrawArrays(GL_TRIANGLES, 0, vertexCount);
    glBindVertexArray(0);
    glUseProgram(0);
}
