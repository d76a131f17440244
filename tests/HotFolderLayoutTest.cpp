// =================================================================
// tests/HotFolderLayoutTest.cpp
// =================================================================
// Unit tests for HotFolderLayout component.

#include "Hotify/HotFolderLayout.hpp"
#include <iostream>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <unistd.h>

namespace fs = std::filesystem;

class HotFolderLayoutTest {
private:
    fs::path m_base;
    Hotify::EnvironmentRegistryPtr m_registry;
    std::unique_ptr<Hotify::HotFolderLayout> m_layout;
    
    void createFile(const fs::path& path) {
        fs::create_directories(path.parent_path());
        std::ofstream(path) << "content";
    }
    
public:
    HotFolderLayoutTest()
        : m_base(fs::temp_directory_path() / ("hotify_layout_test_" + std::to_string(getpid())))
    {
        fs::remove_all(m_base);
        fs::create_directories(m_base);
        
        std::vector<Hotify::Environment> environments;
        environments.emplace_back("pdf-ocr-deu", std::vector<std::string>{"*.pdf"},
                                  std::vector<std::string>{"ocrmypdf {in_file} {out_file}"});
        environments.emplace_back("images-to-pdf", std::vector<std::string>{"*.jpg"},
                                  std::vector<std::string>{"img2pdf {in_files} -o {out_file}"});
        m_registry = std::make_shared<const Hotify::EnvironmentRegistry>(std::move(environments));
        m_layout = std::make_unique<Hotify::HotFolderLayout>(m_base, "hotfolders", "output");
    }
    
    ~HotFolderLayoutTest() {
        std::error_code ec;
        fs::remove_all(m_base, ec);
    }
    
    void testPrepare() {
        std::cout << "Testing folder preparation..." << std::endl;
        
        m_layout->prepare(*m_registry);
        assert(fs::is_directory(m_base / "hotfolders"));
        assert(fs::is_directory(m_base / "output"));
        assert(fs::is_directory(m_base / "hotfolders" / "pdf-ocr-deu"));
        assert(fs::is_directory(m_base / "hotfolders" / "images-to-pdf"));
        assert(m_layout->getEnvironmentFolder("pdf-ocr-deu") == m_layout->getHotFolderRoot() / "pdf-ocr-deu");
        
        // Preparing twice is harmless
        m_layout->prepare(*m_registry);
        
        std::cout << "✓ Preparation test passed" << std::endl;
    }
    
    void testOutputPaths() {
        std::cout << "Testing output path derivation..." << std::endl;
        
        const std::string output = m_layout->getOutputFolder().string();
        assert(m_layout->outputPathFor({"/x/hotfolders/pdf-ocr-deu/letter.pdf"}, Hotify::TriggerMode::SingleFile) ==
               output + "/letter.pdf");
        assert(m_layout->outputPathFor({"/x/a.jpg", "/x/b.jpg"}, Hotify::TriggerMode::Batch) ==
               output + "/multiple--a.jpg");
        
        bool threw = false;
        try {
            m_layout->outputPathFor({}, Hotify::TriggerMode::Batch);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
        
        std::cout << "✓ Output path test passed" << std::endl;
    }
    
    void testEventFor() {
        std::cout << "Testing event mapping..." << std::endl;
        
        const fs::path root = m_layout->getHotFolderRoot();
        
        auto event = m_layout->eventFor(root / "pdf-ocr-deu" / "letter.pdf");
        assert(event);
        assert(event->hot_folder == "pdf-ocr-deu");
        assert(event->instance == "pdf-ocr-deu");
        assert(event->path == (root / "pdf-ocr-deu" / "letter.pdf").string());
        
        event = m_layout->eventFor(root / "images-to-pdf" / "holiday" / "1.jpg");
        assert(event);
        assert(event->hot_folder == "images-to-pdf");
        assert(event->instance == "images-to-pdf/holiday" && "Sub-folders are separate instances");
        
        assert(!m_layout->eventFor(root / "stray.pdf") && "Files in the root belong to no environment");
        assert(!m_layout->eventFor(m_base / "output" / "letter.pdf"));
        assert(!m_layout->eventFor("/etc/passwd"));
        
        std::cout << "✓ Event mapping test passed" << std::endl;
    }
    
    void testExistingFiles() {
        std::cout << "Testing scan for waiting files..." << std::endl;
        
        const fs::path root = m_layout->getHotFolderRoot();
        createFile(root / "pdf-ocr-deu" / "old.pdf");
        createFile(root / "images-to-pdf" / "set" / "new.jpg");
        createFile(root / "pdf-ocr-deu" / ".hidden.pdf");
        createFile(root / "pdf-ocr-deu" / "download.pdf.part");
        createFile(root / "pdf-ocr-deu" / ".cache" / "inside.pdf");
        createFile(root / "stray.pdf");
        
        auto now = fs::file_time_type::clock::now();
        fs::last_write_time(root / "pdf-ocr-deu" / "old.pdf", now - std::chrono::hours(1));
        fs::last_write_time(root / "images-to-pdf" / "set" / "new.jpg", now);
        
        auto events = m_layout->existingFiles(*m_registry);
        assert(events.size() == 2 && "Hidden, partial and root files are skipped");
        assert(events[0].path == (root / "pdf-ocr-deu" / "old.pdf").string() && "Oldest first");
        assert(events[1].instance == "images-to-pdf/set");
        
        std::cout << "✓ Scan test passed" << std::endl;
    }
    
    void testIgnoredNames() {
        std::cout << "Testing ignored file names..." << std::endl;
        
        assert(Hotify::isIgnoredFileName(".DS_Store"));
        assert(Hotify::isIgnoredFileName("report.docx~"));
        assert(Hotify::isIgnoredFileName("video.mp4.crdownload"));
        assert(Hotify::isIgnoredFileName("upload.tmp"));
        assert(Hotify::isIgnoredFileName(""));
        assert(!Hotify::isIgnoredFileName("scan.pdf"));
        assert(Hotify::isIgnoredFileName(".tmp.pdf") && "Leading dot wins");
        assert(!Hotify::isIgnoredFileName("tmp"));
        
        std::cout << "✓ Ignored name test passed" << std::endl;
    }
    
    void testClean() {
        std::cout << "Testing clean..." << std::endl;
        
        createFile(m_layout->getOutputFolder() / "result.pdf");
        assert(m_layout->clean());
        assert(!fs::exists(m_layout->getHotFolderRoot()));
        assert(fs::exists(m_layout->getOutputFolder() / "result.pdf") && "Outputs survive a clean");
        
        std::cout << "✓ Clean test passed" << std::endl;
    }
    
    void runAllTests() {
        std::cout << "=== Running HotFolderLayout Tests ===" << std::endl;
        
        testPrepare();
        testOutputPaths();
        testEventFor();
        testExistingFiles();
        testIgnoredNames();
        testClean();
        
        std::cout << "All HotFolderLayout tests passed!" << std::endl;
    }
};

int main() {
    try {
        HotFolderLayoutTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
