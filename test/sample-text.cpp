// mixed scripts, two and three and four byte sequences, and the few
// controls the text tables allow
extern const char* sample_text;

const char* sample_text =
        "English: The quick brown fox jumps over the lazy dog.\n"
        "Français: Portez ce vieux whisky au juge blond qui fume.\n"
        "Deutsch: Falsches Üben von Xylophonmusik quält jeden größeren Zwerg.\n"
        "Ελληνικά: Ξεσκεπάζω τὴν ψυχοφθόρα βδελυγμία.\n"
        "Русский: Съешь же ещё этих мягких французских булок, да выпей чаю.\n"
        "עברית: דג סקרן שט בים מאוכזב ולפתע מצא חברה.\n"
        "العربية: نص حكيم له سر قاطع وذو شأن عظيم.\n"
        "日本語: いろはにほへと ちりぬるを わかよたれそ つねならむ\n"
        "中文: 天地玄黄，宇宙洪荒。日月盈昃，辰宿列张。\n"
        "한국어: 키스의 고유조건은 입술끼리 만나야 하고 특별한 기술은 필요치 않다.\n"
        "ไทย: เป็นมนุษย์สุดประเสริฐเลิศคุณค่า\n"
        "Math:\t∀x∈ℝ, ⌈x⌉ = −⌊−x⌋, ∅ ⊄ ⊅ ⊆ ⊇, α² + β² = γ²\r\n"
        "Symbols: © ® ° ± ¢ £ ¥ € ‰ † ‡ • … ™ ← ↑ → ↓ ⇔\n"
        "Emoji: 😀 😁 😂 🤣 😃 👍🏽 🎉 🚀 𝄞 𐍈\n";
