/**
 * @file test_graph.cpp
 * @brief Link registration, dependency resolution and build tests
 *
 * This test verifies:
 * - Duplicate identifiers within a kind, and equal names across kinds
 * - Unknown dependencies and cycles fail before any allocation
 * - Dependencies are realized before their dependents
 * - The shader/program/vertex array/attribute/buffer scenario
 * - Missing render callback and missing context
 * - Compile and link errors carry the driver log
 * - Partially built graphs are released on failure
 * - Attribute and uniform location resolution
 */

#include <linkgl/linkgl.hpp>

#include "fake_context.hpp"

#include <iostream>
#include <cassert>
#include <stdexcept>
#include <string>
#include <vector>

using namespace linkgl;
using linkgl::testing::FakeCanvas;
using linkgl::testing::RecordingContext;

namespace {

const char* VERTEX_SOURCE =
    "#version 300 es\n"
    "in vec2 a_position;\n"
    "void main() { gl_Position = vec4(a_position, 0.0, 1.0); }\n";

const char* FRAGMENT_SOURCE =
    "#version 300 es\n"
    "precision mediump float;\n"
    "uniform float u_time;\n"
    "out vec4 color;\n"
    "void main() { color = vec4(u_time); }\n";

const std::vector<float> QUAD_VERTICES = {
    -1.0f, -1.0f,   1.0f, -1.0f,   1.0f, 1.0f,
    -1.0f, -1.0f,   1.0f,  1.0f,  -1.0f, 1.0f
};

void noRender(RendererData&) {}

Handle createQuadBuffer(const LinkContext& ctx) {
    Handle buffer = ctx.gl().createBuffer();
    ctx.gl().bindBuffer(GL_ARRAY_BUFFER, buffer);
    ctx.gl().bufferData(GL_ARRAY_BUFFER, QUAD_VERTICES, GL_STATIC_DRAW);
    return buffer;
}

void describePositions(const AttributeContext& ctx) {
    ctx.gl().vertexAttribPointer(ctx.location(), 2, GL_FLOAT, false, 0, 0);
}

void prepareLocations(RecordingContext& gl) {
    gl.attributes["a_position"] = 0;
    gl.uniforms["u_time"] = 1;
}

/// vs, fs -> program -> vao; attribute(vao, buffer)
Renderer::Builder quadBuilder(FakeCanvas& canvas) {
    prepareLocations(canvas.context);

    Renderer::Builder builder = Renderer::create();
    builder.canvas(&canvas)
        .renderCallback(noRender)
        .addVertexShaderSource("quad_vs", VERTEX_SOURCE)
        .addFragmentShaderSource("quad_fs", FRAGMENT_SOURCE)
        .addProgramLink(ProgramLink("quad", "quad_vs", "quad_fs"))
        .addVertexArrayObject("quad", ProgramId("quad"))
        .addAttributeLink(AttributeLink("a_position", {"quad"}, "quad", describePositions))
        .addBufferLink(BufferLink("quad", createQuadBuffer));
    return builder;
}

} // anonymous namespace

void test_duplicate_ids() {
    std::cout << "Testing: Duplicate identifiers... ";

    LinkRegistry registry;
    registry.add(BufferLink("quad", createQuadBuffer));

    bool threw = false;
    try {
        registry.add(BufferLink("quad", createQuadBuffer));
    } catch (const DuplicateIdError& e) {
        threw = true;
        assert(e.ref() == BufferId("quad").ref());
    }
    assert(threw);
    assert(registry.size() == 1);

    // Same string in another namespace is independent
    registry.add(ShaderLink("quad", ShaderStage::Vertex, VERTEX_SOURCE));
    registry.add(VertexArrayLink("quad"));
    assert(registry.size() == 3);
    assert(registry.contains(ShaderId("quad")));
    assert(registry.contains(VertexArrayId("quad")));
    assert(!registry.contains(TextureId("quad")));

    // Shader sources go through the same check
    threw = false;
    try {
        Renderer::create()
            .addVertexShaderSource("vs", VERTEX_SOURCE)
            .addVertexShaderSource("vs", VERTEX_SOURCE);
    } catch (const DuplicateIdError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "PASSED\n";
}

void test_cross_namespace_build() {
    std::cout << "Testing: Equal names across kinds build... ";

    FakeCanvas canvas;
    prepareLocations(canvas.context);

    auto renderer = Renderer::create()
        .canvas(&canvas)
        .renderCallback(noRender)
        .addVertexShaderSource("same", VERTEX_SOURCE)
        .addFragmentShaderSource("same_fs", FRAGMENT_SOURCE)
        .addProgramLink(ProgramLink("same", "same", "same_fs"))
        .addBufferLink(BufferLink("same", createQuadBuffer))
        .addVertexArrayObject("same", ProgramId("same"))
        .build();

    Handle shader = renderer->shader("same");
    Handle program = renderer->program("same");
    Handle buffer = renderer->buffer("same");
    Handle vertexArray = renderer->vertexArray("same");
    assert(shader != NULL_HANDLE && program != NULL_HANDLE);
    assert(buffer != NULL_HANDLE && vertexArray != NULL_HANDLE);
    assert(shader != program && program != buffer && buffer != vertexArray);

    std::cout << "PASSED\n";
}

void test_unknown_dependency() {
    std::cout << "Testing: Unknown dependency fails before allocation... ";

    FakeCanvas canvas;
    bool threw = false;
    try {
        Renderer::create()
            .canvas(&canvas)
            .renderCallback(noRender)
            .addVertexShaderSource("vs", VERTEX_SOURCE)
            .addProgramLink(ProgramLink("p", "vs", "missing_fs"))
            .build();
    } catch (const UnknownIdError& e) {
        threw = true;
        assert(e.ref() == ShaderId("missing_fs").ref());
        assert(std::string(e.what()).find("program 'p'") != std::string::npos);
    }
    assert(threw);
    assert(canvas.context.created == 0);

    std::cout << "PASSED\n";
}

void test_cycle_detection() {
    std::cout << "Testing: Cycle detection allocates nothing... ";

    FakeCanvas canvas;
    bool threw = false;
    try {
        Renderer::create()
            .canvas(&canvas)
            .renderCallback(noRender)
            .addBufferLink(BufferLink("a", createQuadBuffer).dependsOn(BufferId("b")))
            .addBufferLink(BufferLink("b", createQuadBuffer).dependsOn(TextureId("t")))
            .addTextureLink(TextureLink("t", [](const LinkContext& ctx) {
                return ctx.gl().createTexture();
            }).dependsOn(BufferId("a")))
            .build();
    } catch (const CyclicDependencyError& e) {
        threw = true;
        const auto& cycle = e.cycle();
        assert(cycle.size() == 4);
        assert(cycle.front() == cycle.back());
        assert(std::string(e.what()).find(" -> ") != std::string::npos);
    }
    assert(threw);
    assert(canvas.context.created == 0);

    // Self-dependency
    threw = false;
    try {
        Renderer::create()
            .canvas(&canvas)
            .renderCallback(noRender)
            .addBufferLink(BufferLink("self", createQuadBuffer).dependsOn(BufferId("self")))
            .build();
    } catch (const CyclicDependencyError& e) {
        threw = true;
        assert(e.cycle().size() == 2);
    }
    assert(threw);
    assert(canvas.context.created == 0);

    std::cout << "PASSED\n";
}

void test_topological_order() {
    std::cout << "Testing: Dependencies ordered before dependents... ";

    LinkRegistry registry;
    registry.add(AttributeLink("a_position", {"v"}, "b", describePositions));
    registry.add(VertexArrayLink("v", ProgramId("p")));
    registry.add(ProgramLink("p", "vs", "fs"));
    registry.add(BufferLink("b", createQuadBuffer));
    registry.add(ShaderLink("fs", ShaderStage::Fragment, FRAGMENT_SOURCE));
    registry.add(ShaderLink("vs", ShaderStage::Vertex, VERTEX_SOURCE));

    auto order = DependencyGraph(registry).sort();
    assert(order.size() == registry.size());

    auto position = [&](const ResourceRef& ref) {
        for (size_t i = 0; i < order.size(); ++i) {
            if (order[i] == ref) {
                return i;
            }
        }
        assert(false && "missing from order");
        return order.size();
    };

    for (const auto& ref : order) {
        for (const auto& dependency : registry.dependencies(ref)) {
            assert(position(dependency) < position(ref));
        }
    }
    assert(position(ShaderId("vs")) < position(ProgramId("p")));
    assert(position(ShaderId("fs")) < position(ProgramId("p")));
    assert(position(BufferId("b")) < position(AttributeId("a_position")));
    assert(position(VertexArrayId("v")) < position(AttributeId("a_position")));

    // Independent links keep registration order
    LinkRegistry independent;
    independent.add(TextureLink("t2", nullptr));
    independent.add(BufferLink("b1", nullptr));
    independent.add(TextureLink("t1", nullptr));
    auto flat = DependencyGraph(independent).sort();
    assert(flat.size() == 3);
    assert(flat[0] == TextureId("t2").ref());
    assert(flat[1] == BufferId("b1").ref());
    assert(flat[2] == TextureId("t1").ref());

    std::cout << "PASSED\n";
}

void test_large_graph() {
    std::cout << "Testing: Large graph sorts in dependency order... ";

    const size_t count = 5000;

    // A chain registered back to front, plus a same-named texture per buffer
    LinkRegistry registry;
    for (size_t i = count; i-- > 0;) {
        std::string name = "n" + std::to_string(i);
        BufferLink buffer(name, nullptr);
        if (i > 0) {
            buffer.dependsOn(BufferId("n" + std::to_string(i - 1)));
        }
        registry.add(buffer);
        registry.add(TextureLink(name, nullptr).dependsOn(BufferId(name)));
    }

    auto order = DependencyGraph(registry).sort();
    assert(order.size() == 2 * count);

    // Each buffer frees the next one in the chain, which was registered
    // earlier than any waiting texture; textures follow in registration order
    for (size_t i = 0; i < count; ++i) {
        assert(order[i] == BufferId("n" + std::to_string(i)).ref());
        assert(order[count + i] == TextureId("n" + std::to_string(count - 1 - i)).ref());
    }

    std::cout << "PASSED\n";
}

void test_create_callbacks_see_dependencies() {
    std::cout << "Testing: Create callbacks see live dependencies... ";

    FakeCanvas canvas;
    std::vector<std::string> created;

    Handle seenBuffer = NULL_HANDLE;
    Handle seenTexture = NULL_HANDLE;

    // Registered dependents-first on purpose
    auto renderer = Renderer::create()
        .canvas(&canvas)
        .renderCallback(noRender)
        .addFramebufferLink(FramebufferLink("target", [&](const FramebufferContext& ctx) {
            created.push_back("framebuffer");
            seenTexture = ctx.linkedTexture();
            assert(ctx.texture("color") == ctx.linkedTexture());
            assert(ctx.creating());
            Handle framebuffer = ctx.gl().createFramebuffer();
            ctx.gl().bindFramebuffer(GL_FRAMEBUFFER, framebuffer);
            ctx.gl().framebufferTexture2D(GL_FRAMEBUFFER, GL_COLOR_ATTACHMENT0,
                                          GL_TEXTURE_2D, ctx.linkedTexture(), 0);
            return framebuffer;
        }, TextureId("color")))
        .addTextureLink(TextureLink("color", [&](const LinkContext& ctx) {
            created.push_back("texture");
            seenBuffer = ctx.buffer("pixels");
            assert(seenBuffer != NULL_HANDLE);
            Handle texture = ctx.gl().createTexture();
            ctx.gl().bindTexture(GL_TEXTURE_2D, texture);
            ctx.gl().texImage2D(GL_TEXTURE_2D, 0, GL_RGBA, 4, 4, GL_RGBA, GL_UNSIGNED_BYTE, nullptr);
            return texture;
        }).dependsOn(BufferId("pixels")))
        .addBufferLink(BufferLink("pixels", [&](const LinkContext& ctx) {
            created.push_back("buffer");
            return ctx.gl().createBuffer();
        }))
        .build();

    assert(created.size() == 3);
    assert(created[0] == "buffer");
    assert(created[1] == "texture");
    assert(created[2] == "framebuffer");
    assert(seenBuffer == renderer->buffer("pixels"));
    assert(seenTexture == renderer->texture("color"));
    assert(canvas.context.count("framebufferTexture2D " + std::to_string(seenTexture)) == 1);

    std::cout << "PASSED\n";
}

void test_five_resource_scenario() {
    std::cout << "Testing: Shader/program/vertex array/attribute/buffer graph... ";

    FakeCanvas canvas;
    Handle seen[5] = {};
    int renders = 0;

    auto builder = quadBuilder(canvas);
    builder.renderCallback([&](RendererData& data) {
        seen[0] = data.shader("quad_vs");
        seen[1] = data.shader("quad_fs");
        seen[2] = data.program("quad");
        seen[3] = data.vertexArray("quad");
        seen[4] = data.buffer("quad");
        data.useProgramWithVertexArray("quad", "quad");
        data.gl().drawArrays(GL_TRIANGLES, 0, 6);
        renders++;
    });

    auto renderer = builder.build();
    RecordingContext& gl = canvas.context;

    assert(gl.live.size() == 5);
    assert(renderer->data().handleCount() == 5);
    assert(canvas.acquisitions == 1);

    // Program was linked from both shaders
    Handle program = renderer->program("quad");
    assert(gl.attachedShaders[program].size() == 2);
    assert(gl.attachedShaders[program][0] == renderer->shader("quad_vs"));
    assert(gl.attachedShaders[program][1] == renderer->shader("quad_fs"));

    // Attribute recorded into the vertex array with the buffer bound
    Handle vertexArray = renderer->vertexArray("quad");
    Handle buffer = renderer->buffer("quad");
    assert(renderer->attributeLocation("a_position", "quad") == 0);
    assert(gl.enabledAttributes[vertexArray].count(0) == 1);
    assert(gl.count("vertexAttribPointer 0 2 vao=" + std::to_string(vertexArray) +
                    " buffer=" + std::to_string(buffer)) == 1);
    assert(gl.currentVertexArray == NULL_HANDLE);  // Unbound after recording

    renderer->render();
    assert(renders == 1);
    for (Handle handle : seen) {
        assert(handle != NULL_HANDLE);
        assert(gl.live.count(handle) == 1);
    }
    assert(gl.count("drawArrays 6 program=" + std::to_string(program) +
                    " vao=" + std::to_string(vertexArray)) == 1);

    std::cout << "PASSED\n";
}

void test_missing_render_callback() {
    std::cout << "Testing: Missing render callback... ";

    FakeCanvas canvas;
    bool threw = false;
    try {
        Renderer::create()
            .canvas(&canvas)
            .addBufferLink(BufferLink("quad", createQuadBuffer))
            .build();
    } catch (const MissingRenderCallbackError&) {
        threw = true;
    }
    assert(threw);
    assert(canvas.context.created == 0);
    assert(canvas.acquisitions == 0);

    std::cout << "PASSED\n";
}

void test_context_acquisition() {
    std::cout << "Testing: Context acquisition failures... ";

    bool threw = false;
    try {
        Renderer::create().renderCallback(noRender).build();
    } catch (const ContextAcquisitionError&) {
        threw = true;
    }
    assert(threw);

    FakeCanvas canvas;
    canvas.provideContext = false;
    threw = false;
    try {
        Renderer::create().canvas(&canvas).renderCallback(noRender).build();
    } catch (const ContextAcquisitionError&) {
        threw = true;
    }
    assert(threw);
    assert(canvas.acquisitions == 1);

    // Attributes are passed through to the canvas
    FakeCanvas attributed;
    ContextAttributes attributes;
    attributes.antialias = false;
    attributes.stencil = true;
    auto renderer = Renderer::create()
        .canvas(&attributed)
        .contextAttributes(attributes)
        .renderCallback(noRender)
        .build();
    assert(attributed.lastAttributes == attributes);
    assert(renderer->data().contextAttributes() == attributes);
    assert(renderer->drawingBufferSize() == glm::uvec2(640, 480));

    std::cout << "PASSED\n";
}

void test_shader_compile_error() {
    std::cout << "Testing: Shader compile error carries the log... ";

    FakeCanvas canvas;
    canvas.context.failCompileMarker = "vec5";

    auto builder = quadBuilder(canvas);
    builder.addFragmentShaderSource("broken_fs", "void main() { vec5 x; }");
    builder.addProgramLink(ProgramLink("broken", "quad_vs", "broken_fs"));

    bool threw = false;
    try {
        builder.build();
    } catch (const ShaderCompileError& e) {
        threw = true;
        assert(e.shaderId() == ShaderId("broken_fs"));
        assert(e.stage() == ShaderStage::Fragment);
        assert(e.log() == canvas.context.compileLog);
        assert(std::string(e.what()).find(canvas.context.compileLog) != std::string::npos);
    }
    assert(threw);

    // Everything created before the failure was released
    assert(canvas.context.created > 0);
    assert(canvas.context.live.empty());
    assert(canvas.context.deleted == canvas.context.created);
    assert(canvas.context.invalidDeletes == 0);

    std::cout << "PASSED\n";
}

void test_program_link_error() {
    std::cout << "Testing: Program link error carries the log... ";

    FakeCanvas canvas;
    canvas.context.failLink = true;

    bool threw = false;
    try {
        quadBuilder(canvas).build();
    } catch (const ProgramLinkError& e) {
        threw = true;
        assert(e.programId() == ProgramId("quad"));
        assert(e.log() == canvas.context.linkLog);
    }
    assert(threw);
    assert(canvas.context.created == 3);  // Two shaders and the program
    assert(canvas.context.live.empty());

    std::cout << "PASSED\n";
}

void test_rollback_on_callback_failure() {
    std::cout << "Testing: Failed build releases everything in reverse order... ";

    FakeCanvas canvas;
    auto builder = quadBuilder(canvas);
    builder.addTextureLink(TextureLink("late", [](const LinkContext&) -> Handle {
        throw std::runtime_error("texture upload failed");
    }).dependsOn(AttributeId("a_position")));

    bool threw = false;
    try {
        builder.build();
    } catch (const std::runtime_error& e) {
        // User exceptions propagate unchanged
        threw = true;
        assert(std::string(e.what()) == "texture upload failed");
    }
    assert(threw);

    RecordingContext& gl = canvas.context;
    assert(gl.created == 5);
    assert(gl.live.empty());
    assert(gl.invalidDeletes == 0);

    // Newest first: the buffer or vertex array goes before the program and shaders
    std::vector<std::string> deletes;
    for (const auto& call : gl.calls) {
        if (call.compare(0, 6, "delete") == 0) {
            deletes.push_back(call);
        }
    }
    assert(deletes.size() == 5);
    assert(deletes[3].compare(0, 12, "deleteShader") == 0);
    assert(deletes[4].compare(0, 12, "deleteShader") == 0);

    std::cout << "PASSED\n";
}

void test_null_handle() {
    std::cout << "Testing: Null handle from the API... ";

    FakeCanvas canvas;
    canvas.context.nullBuffers = true;

    bool threw = false;
    try {
        quadBuilder(canvas).build();
    } catch (const ResourceCreationError& e) {
        threw = true;
        assert(std::string(e.what()).find("buffer 'quad'") != std::string::npos);
    }
    assert(threw);
    assert(canvas.context.live.empty());

    FakeCanvas shaders;
    shaders.context.nullShaders = true;
    threw = false;
    try {
        quadBuilder(shaders).build();
    } catch (const ResourceCreationError&) {
        threw = true;
    }
    assert(threw);
    assert(shaders.context.created == 0);

    std::cout << "PASSED\n";
}

void test_undeclared_lookup() {
    std::cout << "Testing: Callbacks cannot reach undeclared resources... ";

    FakeCanvas canvas;
    bool threw = false;
    try {
        Renderer::create()
            .canvas(&canvas)
            .renderCallback(noRender)
            .addBufferLink(BufferLink("first", createQuadBuffer))
            .addBufferLink(BufferLink("second", [](const LinkContext& ctx) {
                ctx.buffer("first");  // Not declared with dependsOn()
                return ctx.gl().createBuffer();
            }))
            .build();
    } catch (const UnknownIdError& e) {
        threw = true;
        assert(e.ref() == BufferId("first").ref());
    }
    assert(threw);
    assert(canvas.context.live.empty());

    std::cout << "PASSED\n";
}

void test_location_errors() {
    std::cout << "Testing: Location resolution errors... ";

    // Attribute not active in the program
    {
        FakeCanvas canvas;
        auto builder = quadBuilder(canvas);
        canvas.context.attributes.clear();

        bool threw = false;
        try {
            builder.build();
        } catch (const LocationNotFoundError& e) {
            threw = true;
            assert(e.variable() == AttributeId("a_position").ref());
        }
        assert(threw);
        assert(canvas.context.live.empty());
    }

    // Uniform not active in the program
    {
        FakeCanvas canvas;
        auto builder = quadBuilder(canvas);
        builder.addUniformLink(UniformLink("u_missing", {"quad"}, [](const UniformContext&) {}));

        bool threw = false;
        try {
            builder.build();
        } catch (const LocationNotFoundError& e) {
            threw = true;
            assert(e.variable() == UniformId("u_missing").ref());
        }
        assert(threw);
        assert(canvas.context.live.empty());
    }

    // Vertex array without a program and no explicit location
    {
        FakeCanvas canvas;
        bool threw = false;
        try {
            Renderer::create()
                .canvas(&canvas)
                .renderCallback(noRender)
                .addBufferLink(BufferLink("quad", createQuadBuffer))
                .addVertexArrayObject("bare")
                .addAttributeLink(AttributeLink("a_position", {"bare"}, "quad", describePositions))
                .build();
        } catch (const LocationNotFoundError&) {
            threw = true;
        }
        assert(threw);
        assert(canvas.context.live.empty());
    }

    std::cout << "PASSED\n";
}

void test_explicit_location() {
    std::cout << "Testing: Explicit attribute location... ";

    FakeCanvas canvas;
    auto renderer = Renderer::create()
        .canvas(&canvas)
        .renderCallback(noRender)
        .addBufferLink(BufferLink("offsets", createQuadBuffer))
        .addVertexArrayObject("bare")
        .addAttributeLink(AttributeLink("a_offset", {"bare"}, "offsets",
            [](const AttributeContext& ctx) {
                ctx.gl().vertexAttribPointer(ctx.location(), 2, GL_FLOAT, false, 0, 0);
                ctx.gl().vertexAttribDivisor(ctx.location(), 1);
            }).setLocation(3))
        .build();

    Handle vertexArray = renderer->vertexArray("bare");
    assert(renderer->attributeLocation("a_offset", "bare") == 3);
    assert(canvas.context.enabledAttributes[vertexArray].count(3) == 1);
    assert(canvas.context.count("vertexAttribDivisor 3 1") == 1);

    std::cout << "PASSED\n";
}

void test_shared_attributes_and_uniforms() {
    std::cout << "Testing: Attribute across vertex arrays, uniform across programs... ";

    FakeCanvas canvas;
    auto builder = quadBuilder(canvas);
    canvas.context.uniforms["u_time"] = 4;

    std::vector<Handle> uniformPrograms;
    std::vector<Handle> attributeArrays;

    builder.addFragmentShaderSource("blur_fs", FRAGMENT_SOURCE)
        .addProgramLink(ProgramLink("blur", "quad_vs", "blur_fs"))
        .addVertexArrayObject("blur", ProgramId("blur"))
        .addAttributeLink(AttributeLink("a_corner", {"quad", "blur"}, "quad",
            [&](const AttributeContext& ctx) {
                attributeArrays.push_back(ctx.boundVertexArray());
                assert(ctx.attributeBuffer() == ctx.buffer("quad"));
            }))
        .addUniformLink(UniformLink("u_time", {"quad", "blur"}, [&](const UniformContext& ctx) {
            uniformPrograms.push_back(ctx.activeProgram());
            ctx.gl().uniform1f(ctx.location(), 0.0f);
        }));
    canvas.context.attributes["a_corner"] = 1;

    auto renderer = builder.build();

    assert(attributeArrays.size() == 2);
    assert(attributeArrays[0] == renderer->vertexArray("quad"));
    assert(attributeArrays[1] == renderer->vertexArray("blur"));

    assert(uniformPrograms.size() == 2);
    assert(uniformPrograms[0] == renderer->program("quad"));
    assert(uniformPrograms[1] == renderer->program("blur"));
    assert(renderer->uniformLocation("u_time", "quad") == 4);
    assert(renderer->uniformLocation("u_time", "blur") == 4);
    assert(canvas.context.count("uniform1f 4 program=" + std::to_string(renderer->program("blur"))) == 1);
    assert(canvas.context.currentProgram == NULL_HANDLE);

    bool threw = false;
    try {
        renderer->uniformLocation("u_time", "nowhere");
    } catch (const UnknownIdError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "PASSED\n";
}

void test_transform_feedback() {
    std::cout << "Testing: Transform feedback varyings and objects... ";

    FakeCanvas canvas;
    auto renderer = Renderer::create()
        .canvas(&canvas)
        .renderCallback(noRender)
        .addVertexShaderSource("particles_vs", VERTEX_SOURCE)
        .addFragmentShaderSource("particles_fs", FRAGMENT_SOURCE)
        .addProgramLink(ProgramLink("particles", "particles_vs", "particles_fs")
            .transformFeedbackVaryings({"v_position", "v_velocity"}, GL_SEPARATE_ATTRIBS))
        .addTransformFeedbackLink(TransformFeedbackLink("capture"))
        .build();

    Handle program = renderer->program("particles");
    assert(canvas.context.varyings[program].size() == 2);
    assert(canvas.context.varyings[program][0] == "v_position");
    assert(renderer->transformFeedback("capture") != NULL_HANDLE);
    assert(canvas.context.count("createTransformFeedback") == 1);

    // Varyings are declared before linking
    size_t varyingsAt = 0;
    size_t linkAt = 0;
    for (size_t i = 0; i < canvas.context.calls.size(); ++i) {
        if (canvas.context.calls[i].compare(0, 25, "transformFeedbackVaryings") == 0) varyingsAt = i;
        if (canvas.context.calls[i].compare(0, 11, "linkProgram") == 0) linkAt = i;
    }
    assert(varyingsAt < linkAt);

    std::cout << "PASSED\n";
}

void test_builder_reuse() {
    std::cout << "Testing: Builder can build twice... ";

    FakeCanvas canvas;
    auto builder = quadBuilder(canvas);

    auto first = builder.build();
    auto second = builder.build();

    assert(canvas.context.live.size() == 10);
    assert(first->buffer("quad") != second->buffer("quad"));

    first.reset();
    assert(canvas.context.live.size() == 5);
    second->free();
    assert(canvas.context.live.empty());

    std::cout << "PASSED\n";
}

void test_log_sink() {
    std::cout << "Testing: Build logs reach an installed sink... ";

    struct Captured {
        LogLevel level;
        LogCategory category;
        std::string message;
    };
    std::vector<Captured> records;

    Logger& logger = Logger::global();
    logger.setSink([&](const LogRecord& record) {
        records.push_back({record.level, record.category, std::string(record.message)});
    });
    logger.setCategoryLevel(LogCategory::Graph, LogLevel::Info);
    assert(logger.hasSink());
    assert(logger.isEnabled(LogLevel::Info, LogCategory::Graph));
    assert(!logger.isEnabled(LogLevel::Debug, LogCategory::Graph));
    assert(!logger.isEnabled(LogLevel::Error, LogCategory::Resource));

    FakeCanvas canvas;
    auto renderer = quadBuilder(canvas).build();

    // Only the Graph summary passes the filter
    assert(records.size() == 1);
    assert(records[0].level == LogLevel::Info);
    assert(records[0].category == LogCategory::Graph);
    assert(records[0].message == "Renderer built: 6 links, 5 handles");

    records.clear();
    FakeCanvas failing;
    auto builder = quadBuilder(failing);
    builder.addBufferLink(BufferLink("broken", [](const LinkContext&) -> Handle {
        throw std::runtime_error("out of memory");
    }).dependsOn(BufferId("quad")));

    bool threw = false;
    try {
        builder.build();
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);
    assert(records.size() == 1);
    assert(records[0].level == LogLevel::Error);
    assert(records[0].message == "Build failed, released 5 handles");

    logger.setSink(nullptr);
    logger.clearCategoryLevels();
    assert(!logger.hasSink());
    assert(!logger.isEnabled(LogLevel::Info, LogCategory::Graph));

    std::cout << "PASSED\n";
}

int main() {
    std::cout << "\n========================================\n";
    std::cout << "linkgl - Graph & Build Tests\n";
    std::cout << "========================================\n\n";

    Logger::global().setMinLevel(LogLevel::Fatal);

    try {
        test_duplicate_ids();
        test_cross_namespace_build();
        test_unknown_dependency();
        test_cycle_detection();
        test_topological_order();
        test_large_graph();
        test_create_callbacks_see_dependencies();
        test_five_resource_scenario();
        test_missing_render_callback();
        test_context_acquisition();
        test_shader_compile_error();
        test_program_link_error();
        test_rollback_on_callback_failure();
        test_null_handle();
        test_undeclared_lookup();
        test_location_errors();
        test_explicit_location();
        test_shared_attributes_and_uniforms();
        test_transform_feedback();
        test_builder_reuse();
        test_log_sink();

        std::cout << "\n========================================\n";
        std::cout << "All graph tests PASSED!\n";
        std::cout << "========================================\n\n";
    }
    catch (const std::exception& e) {
        std::cerr << "\nTEST FAILED with exception: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
