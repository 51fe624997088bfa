/**
 * @file main.cpp
 * @brief Hello Quad example - an animated full-screen quad
 *
 * Demonstrates:
 * - Window creation with an OpenGL ES 3.0 context
 * - Declaring shaders, a program, a buffer, a vertex array, an attribute
 *   and uniforms as links, in any order
 * - A uniform that reuses its create callback every frame
 * - Animating through the window's FrameLoop
 */

#include <linkgl/linkgl_window.hpp>

#include <iostream>
#include <vector>

namespace {

const char* VERTEX_SOURCE = R"(#version 300 es
in vec2 a_position;
out vec2 v_uv;
void main() {
    v_uv = a_position * 0.5 + 0.5;
    gl_Position = vec4(a_position, 0.0, 1.0);
}
)";

const char* FRAGMENT_SOURCE = R"(#version 300 es
precision mediump float;
uniform float u_time;
uniform vec2 u_resolution;
in vec2 v_uv;
out vec4 color;
void main() {
    float t = u_time * 0.001;
    vec2 p = v_uv * u_resolution / min(u_resolution.x, u_resolution.y);
    color = vec4(0.5 + 0.5 * cos(t + p.xyx + vec3(0.0, 2.0, 4.0)), 1.0);
}
)";

const std::vector<float> QUAD_VERTICES = {
    -1.0f, -1.0f,   1.0f, -1.0f,   1.0f, 1.0f,
    -1.0f, -1.0f,   1.0f,  1.0f,  -1.0f, 1.0f
};

} // anonymous namespace

int main() {
    std::cout << "linkgl - Hello Quad\n\n";

    try {
        auto window = linkgl::Window::create()
            .title("Hello Quad")
            .size(800, 600)
            .resizable(true)
            .build();

        std::cout << "Window created successfully.\n";

        // Must outlive the renderer: the renderer cancels its pending frame on free()
        linkgl::FrameLoop loop(window.get());

        window->onKey([&window](linkgl::Key key, linkgl::Action action, linkgl::Modifier) {
            if (key == GLFW_KEY_ESCAPE && action == linkgl::Action::Press) {
                window->close();
            }
        });

        auto renderer = linkgl::Renderer::create()
            .canvas(window.get())
            .frameScheduler(&loop)
            .addAttributeLink(linkgl::AttributeLink("a_position", {"quad"}, "quad",
                [](const linkgl::AttributeContext& ctx) {
                    ctx.gl().vertexAttribPointer(ctx.location(), 2, GL_FLOAT, false, 0, 0);
                }))
            .addVertexArrayObject("quad", linkgl::ProgramId("quad"))
            .addBufferLink(linkgl::BufferLink("quad", [](const linkgl::LinkContext& ctx) {
                linkgl::Handle buffer = ctx.gl().createBuffer();
                ctx.gl().bindBuffer(GL_ARRAY_BUFFER, buffer);
                ctx.gl().bufferData(GL_ARRAY_BUFFER, QUAD_VERTICES, GL_STATIC_DRAW);
                return buffer;
            }))
            .addUniformLink(linkgl::UniformLink("u_time", {"quad"},
                [](const linkgl::UniformContext& ctx) {
                    ctx.gl().uniform1f(ctx.location(), static_cast<float>(ctx.now()));
                }).setUseInitCallbackForUpdate(true))
            .addUniformLink(linkgl::UniformLink("u_resolution", {"quad"},
                [&window](const linkgl::UniformContext& ctx) {
                    ctx.gl().uniform2f(ctx.location(), glm::vec2(window->drawingBufferSize()));
                }).setUseInitCallbackForUpdate(true))
            .addProgramLink(linkgl::ProgramLink("quad", "quad_vs", "quad_fs"))
            .addVertexShaderSource("quad_vs", VERTEX_SOURCE)
            .addFragmentShaderSource("quad_fs", FRAGMENT_SOURCE)
            .renderCallback([](linkgl::RendererData& data) {
                glm::uvec2 size = data.drawingBufferSize();
                data.gl().viewport(0, 0, static_cast<GLsizei>(size.x), static_cast<GLsizei>(size.y));
                data.gl().clearColor(glm::vec4(0.0f, 0.0f, 0.0f, 1.0f));
                data.gl().clear(GL_COLOR_BUFFER_BIT);

                data.useProgramWithVertexArray("quad", "quad");
                data.gl().drawArrays(GL_TRIANGLES, 0, 6);
            })
            .build();

        std::cout << "Renderer built with " << renderer->data().handleCount() << " handles.\n";
        std::cout << "\nPress Escape or close the window to exit.\n";

        renderer->startAnimating();
        loop.run();

        std::cout << "Ran " << loop.frameNumber() << " frames.\n";

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
