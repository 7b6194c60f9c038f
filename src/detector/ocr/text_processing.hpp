#pragma once

#include <string>
#include <vector>

namespace text_processing
{
    // One recognized text line
    struct TextRegion
    {
        std::string text;
        double confidence = 0.0; // 0..1
        int top = 0;             // Bounding box, image coordinates
        int bottom = 0;
    };

    // OCR verdict parameters
    struct TextParams
    {
        int min_chars = 10;          // Threshold rule: characters needed
        double min_confidence = 0.6; // Threshold rule: average confidence needed
        bool extra_heuristics = true;

        // Caption rule
        double high_confidence = 0.7;  // A region above this counts as high confidence
        int large_block_chars = 20;    // A region longer than this is a large block
        int caption_min_regions = 2;   // High-confidence regions and large blocks needed
        int caption_min_chars = 30;
        double caption_min_density = 10.0;

        // Dense text rule
        double dense_min_density = 15.0;
        double dense_min_confidence = 0.45;
        int dense_min_chars = 50;
    };

    // Metrics and verdict for one image
    struct TextAnalysis
    {
        int total_chars = 0;
        double avg_confidence = 0.0;
        int high_conf_regions = 0;
        int large_text_blocks = 0;
        bool has_bottom_text = false; // Most regions start in the bottom third
        double text_density = 0.0;    // Characters per region
        bool screenshot = false;
    };

    // Number of characters (UTF-8 code points) in text
    int countCharacters(const std::string &text);

    // Apply the threshold rule, then (optionally) the caption and dense-text rules
    TextAnalysis evaluate(const std::vector<TextRegion> &regions, int image_height, const TextParams &params = TextParams());

} // namespace text_processing
