// =================================================================
// tests/TemplateRendererTest.cpp
// =================================================================
// Unit tests for TemplateRenderer component.

#include "Hotify/Errors.hpp"
#include "Hotify/TemplateRenderer.hpp"
#include <iostream>
#include <cassert>
#include <string>
#include <vector>

class TemplateRendererTest {
private:
    Hotify::TemplateRenderer renderer;
    
    static std::string outputFor(const Hotify::Environment&, const std::vector<std::string>& inputs,
                                 Hotify::TriggerMode mode) {
        std::string name = inputs.front().substr(inputs.front().find_last_of('/') + 1);
        return mode == Hotify::TriggerMode::Batch ? "/out/multiple--" + name : "/out/" + name;
    }
    
public:
    TemplateRendererTest() : renderer(&TemplateRendererTest::outputFor) {}
    
    void testSingleFileRendering() {
        std::cout << "Testing single-file rendering..." << std::endl;
        
        Hotify::Environment ocr("pdf-ocr-deu", {"*.pdf"}, {"ocrmypdf -l deu {in_file} {out_file}"});
        auto invocation = renderer.render(ocr, Hotify::RenderContext::forFile("/hot/pdf-ocr-deu/a.pdf"),
                                          "pdf-ocr-deu");
        
        assert(invocation.environment == "pdf-ocr-deu");
        assert(invocation.instance == "pdf-ocr-deu");
        assert(invocation.commands.size() == 1);
        assert(invocation.commands[0] == "ocrmypdf -l deu /hot/pdf-ocr-deu/a.pdf /out/a.pdf");
        assert(invocation.consumed_inputs.size() == 1);
        assert(invocation.consumed_inputs[0] == "/hot/pdf-ocr-deu/a.pdf");
        assert(invocation.produced_output && *invocation.produced_output == "/out/a.pdf");
        
        std::cout << "✓ Single-file rendering test passed" << std::endl;
    }
    
    void testExplicitOutFile() {
        std::cout << "Testing explicit out_file binding..." << std::endl;
        
        Hotify::Environment copy("copy", {"*"}, {"cp {in_file} {out_file}"});
        Hotify::RenderContext context = Hotify::RenderContext::forFile("/in/x.txt");
        context.out_file = "/elsewhere/y.txt";
        
        auto invocation = renderer.render(copy, context);
        assert(invocation.commands[0] == "cp /in/x.txt /elsewhere/y.txt");
        assert(*invocation.produced_output == "/elsewhere/y.txt");
        
        std::cout << "✓ Explicit out_file test passed" << std::endl;
    }
    
    void testBatchRendering() {
        std::cout << "Testing batch rendering..." << std::endl;
        
        Hotify::Environment images("images-to-pdf", {"*.jpg"}, {"img2pdf {in_files} -o {out_file}"});
        std::vector<std::string> files = {"/hot/i/1.jpg", "/hot/i/my photo.jpg", "/hot/i/1.jpg"};
        auto invocation = renderer.render(images, Hotify::RenderContext::forBatch(files), "images-to-pdf");
        
        assert(invocation.consumed_inputs.size() == 2 && "Duplicates are consumed once");
        assert(invocation.consumed_inputs[0] == "/hot/i/1.jpg");
        assert(invocation.consumed_inputs[1] == "/hot/i/my photo.jpg");
        assert(invocation.commands[0] ==
               "img2pdf \"/hot/i/1.jpg\" \"/hot/i/my photo.jpg\" -o /out/multiple--1.jpg");
        
        std::cout << "✓ Batch rendering test passed" << std::endl;
    }
    
    void testQuoting() {
        std::cout << "Testing {in_files} quoting..." << std::endl;
        
        std::string joined = Hotify::TemplateRenderer::joinQuoted({"a b", "c\"d", "$HOME", "x`y`", "back\\slash"});
        assert(joined == "\"a b\" \"c\\\"d\" \"\\$HOME\" \"x\\`y\\`\" \"back\\\\slash\"");
        assert(Hotify::TemplateRenderer::joinQuoted({}).empty());
        
        std::cout << "✓ Quoting test passed" << std::endl;
    }
    
    void testChainSharesBindings() {
        std::cout << "Testing bindings shared across the chain..." << std::endl;
        
        Hotify::Environment chain("chain", {"*.tif"},
                                  {"convert {in_file} /tmp/step.pdf", "ocr /tmp/step.pdf {out_file}", "rm /tmp/step.pdf"});
        auto invocation = renderer.render(chain, Hotify::RenderContext::forFile("/h/c/s.tif"));
        
        assert(invocation.commands.size() == 3);
        assert(invocation.commands[0] == "convert /h/c/s.tif /tmp/step.pdf");
        assert(invocation.commands[1] == "ocr /tmp/step.pdf /out/s.tif");
        assert(invocation.commands[2] == "rm /tmp/step.pdf" && "Steps without placeholders are unchanged");
        
        std::cout << "✓ Chain binding test passed" << std::endl;
    }
    
    void testRenderIsIdempotent() {
        std::cout << "Testing render idempotence..." << std::endl;
        
        Hotify::Environment ocr("pdf-ocr-deu", {"*.pdf"}, {"ocrmypdf {in_file} {out_file}"});
        auto context = Hotify::RenderContext::forFile("/h/p/{in_file}.pdf");
        auto first = renderer.render(ocr, context);
        auto second = renderer.render(ocr, context);
        
        assert(first.commands == second.commands);
        assert(first.consumed_inputs == second.consumed_inputs);
        assert(first.commands[0] == "ocrmypdf /h/p/{in_file}.pdf /out/{in_file}.pdf" &&
               "Substituted values are never rescanned");
        
        std::cout << "✓ Idempotence test passed" << std::endl;
    }
    
    void testUnknownTokensPassThrough() {
        std::cout << "Testing unknown tokens and stray braces..." << std::endl;
        
        Hotify::Environment env("awk", {"*"}, {"awk '{print $1}' {in_file} | sed 's/{x/y/' ${HOME}"});
        auto invocation = renderer.render(env, Hotify::RenderContext::forFile("/f"));
        assert(invocation.commands[0] == "awk '{print $1}' /f | sed 's/{x/y/' ${HOME}");
        
        Hotify::Environment nested("nested", {"*"}, {"echo {{in_file}} {"});
        invocation = renderer.render(nested, Hotify::RenderContext::forFile("/f"));
        assert(invocation.commands[0] == "echo {/f} {");
        
        std::cout << "✓ Pass-through test passed" << std::endl;
    }
    
    void testMixedVariablesRunAsBatch() {
        std::cout << "Testing mixed {in_file} and {in_files}..." << std::endl;
        
        Hotify::Environment mixed("mixed", {"*"}, {"echo {in_file}", "cat {in_files}"});
        auto invocation = renderer.render(mixed, Hotify::RenderContext::forBatch({"/a", "/b"}));
        assert(invocation.commands[0] == "echo " && "{in_file} renders empty in batch mode");
        
        // The token must never reach the shell as a literal argument
        Hotify::Environment removal("removal", {"*"}, {"rm -f {in_file} x{in_file}y", "ls {in_files}"});
        auto cleaned = renderer.render(removal, Hotify::RenderContext::forBatch({"/a"}));
        assert(cleaned.commands[0] == "rm -f  xy");
        assert(cleaned.commands[0].find("{in_file}") == std::string::npos);
        assert(invocation.commands[1] == "cat \"/a\" \"/b\"");
        
        std::cout << "✓ Mixed variable test passed" << std::endl;
    }
    
    void testUnresolvableVariables() {
        std::cout << "Testing unresolvable variables..." << std::endl;
        
        auto raisesConfigurationError = [](const Hotify::TemplateRenderer& r, const Hotify::Environment& env,
                                           const Hotify::RenderContext& context) {
            try {
                r.render(env, context);
            } catch (const Hotify::ConfigurationError& e) {
                return e.kind() == Hotify::ErrorKind::ConfigurationError;
            }
            return false;
        };
        
        Hotify::Environment single("single", {"*"}, {"cat {in_file}"});
        assert(raisesConfigurationError(renderer, single, Hotify::RenderContext()));
        
        Hotify::Environment batch("batch", {"*"}, {"cat {in_files}"});
        assert(raisesConfigurationError(renderer, batch, Hotify::RenderContext::forBatch({})));
        assert(raisesConfigurationError(renderer, batch, Hotify::RenderContext::forFile("/a")));
        
        Hotify::TemplateRenderer no_resolver;
        Hotify::Environment with_output("out", {"*"}, {"cp {in_file} {out_file}"});
        assert(raisesConfigurationError(no_resolver, with_output, Hotify::RenderContext::forFile("/a")));
        
        Hotify::Environment no_output("plain", {"*"}, {"cat {in_file}"});
        auto invocation = no_resolver.render(no_output, Hotify::RenderContext::forFile("/a"));
        assert(!invocation.produced_output && "No out_file without {out_file}");
        
        std::cout << "✓ Unresolvable variable test passed" << std::endl;
    }
    
    void runAllTests() {
        std::cout << "=== Running TemplateRenderer Tests ===" << std::endl;
        
        testSingleFileRendering();
        testExplicitOutFile();
        testBatchRendering();
        testQuoting();
        testChainSharesBindings();
        testRenderIsIdempotent();
        testUnknownTokensPassThrough();
        testMixedVariablesRunAsBatch();
        testUnresolvableVariables();
        
        std::cout << "All TemplateRenderer tests passed!" << std::endl;
    }
};

int main() {
    try {
        TemplateRendererTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
